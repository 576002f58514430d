// agent/device_identity.hpp
#pragma once
#include <string>

class DeviceIdentity {
private:
    static std::string read_cpu_serial(const std::string& cpuinfo_path);
    static std::string read_mac_address(const std::string& address_path);

public:
    static constexpr const char* PREFIX = "powermon_";

    // Configured id wins; then the board serial, the eth0 MAC, and finally
    // random bytes from the OpenSSL CSPRNG.
    static std::string resolve(const std::string& configured,
                               const std::string& cpuinfo_path = "/proc/cpuinfo",
                               const std::string& address_path = "/sys/class/net/eth0/address");

    static std::string random_suffix(size_t bytes);
};
