// agent/config.hpp
#pragma once
#include "sampler.hpp"
#include "../common/protocol.hpp"
#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/powermonitor/config.conf";

// Flat KEY=VALUE store written by the setup wizard. Read-only here.
class ConfigStore {
private:
    std::map<std::string, std::string> values;

public:
    static ConfigStore load_file(const std::string& path);
    static ConfigStore parse(std::istream& in);

    bool has(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& fallback) const;
    double get_double(const std::string& key, double fallback) const;
    int get_int(const std::string& key, int fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;

    size_t size() const { return values.size(); }
};

struct AgentConfig {
    std::string device_id;
    std::string location{"Unknown"};
    std::string timezone;
    std::string server_url{"https://linesights.com/api/data"};
    double grid_voltage{120.0};
    int ct_rating{100};

    std::chrono::seconds send_interval{10};
    std::chrono::seconds error_backoff{5};
    std::chrono::seconds http_timeout{10};

    SamplerSettings sampling;

    int spi_bus{0};
    int spi_device{0};
    uint32_t spi_speed_hz{500000};

    std::vector<ChannelConfig> channels;

    static AgentConfig from_store(const ConfigStore& store);
};
