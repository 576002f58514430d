// agent/device_identity.cpp
#include "device_identity.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <openssl/rand.h>

std::string DeviceIdentity::read_cpu_serial(const std::string& cpuinfo_path) {
    std::ifstream in(cpuinfo_path);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Serial", 0) != 0) continue;

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string serial = line.substr(colon + 1);
        serial.erase(std::remove_if(serial.begin(), serial.end(),
                                    [](unsigned char c) { return std::isspace(c); }),
                     serial.end());
        if (!serial.empty()) return serial;
    }
    return "";
}

std::string DeviceIdentity::read_mac_address(const std::string& address_path) {
    std::ifstream in(address_path);
    std::string mac;
    if (!std::getline(in, mac)) return "";

    mac.erase(std::remove_if(mac.begin(), mac.end(),
                             [](unsigned char c) { return c == ':' || std::isspace(c); }),
              mac.end());
    return mac;
}

std::string DeviceIdentity::random_suffix(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed to generate a device id");
    }

    std::stringstream ss;
    for (unsigned char b : buffer) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::string DeviceIdentity::resolve(const std::string& configured,
                                    const std::string& cpuinfo_path,
                                    const std::string& address_path) {
    if (!configured.empty()) return configured;

    std::string serial = read_cpu_serial(cpuinfo_path);
    if (!serial.empty()) {
        return PREFIX + serial;
    }

    std::string mac = read_mac_address(address_path);
    if (!mac.empty()) {
        return PREFIX + mac;
    }

    std::string id = PREFIX + random_suffix(4);
    Logger::warning("No DEVICE_ID configured and no hardware id found - using " + id);
    return id;
}
