// agent/config.cpp
#include "config.hpp"
#include "device_identity.hpp"
#include "logger.hpp"
#include "power_calculator.hpp"
#include "adc_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::runtime_error invalid_value(const std::string& key, const std::string& value) {
    return std::runtime_error("Invalid value for " + key + ": '" + value + "'");
}

void require(bool condition, const std::string& key, const std::string& what) {
    if (!condition) {
        throw std::runtime_error("Configuration " + key + " " + what);
    }
}

}  // namespace

ConfigStore ConfigStore::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    return parse(in);
}

ConfigStore ConfigStore::parse(std::istream& in) {
    ConfigStore store;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        line_number++;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') continue;

        size_t eq = stripped.find('=');
        if (eq == std::string::npos) {
            Logger::warning("Ignoring malformed configuration line " + std::to_string(line_number));
            continue;
        }

        std::string key = trim(stripped.substr(0, eq));
        if (key.empty()) continue;
        store.values[key] = unquote(trim(stripped.substr(eq + 1)));
    }
    return store;
}

bool ConfigStore::has(const std::string& key) const {
    return values.count(key) > 0;
}

std::string ConfigStore::get_string(const std::string& key, const std::string& fallback) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : fallback;
}

double ConfigStore::get_double(const std::string& key, double fallback) const {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;

    try {
        size_t used = 0;
        double value = std::stod(it->second, &used);
        if (used != it->second.size()) throw invalid_value(key, it->second);
        return value;
    } catch (const std::invalid_argument&) {
        throw invalid_value(key, it->second);
    } catch (const std::out_of_range&) {
        throw invalid_value(key, it->second);
    }
}

int ConfigStore::get_int(const std::string& key, int fallback) const {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;

    try {
        size_t used = 0;
        int value = std::stoi(it->second, &used);
        if (used != it->second.size()) throw invalid_value(key, it->second);
        return value;
    } catch (const std::invalid_argument&) {
        throw invalid_value(key, it->second);
    } catch (const std::out_of_range&) {
        throw invalid_value(key, it->second);
    }
}

bool ConfigStore::get_bool(const std::string& key, bool fallback) const {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;

    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "true" || v == "yes" || v == "1" || v == "on") return true;
    if (v == "false" || v == "no" || v == "0" || v == "off") return false;
    throw invalid_value(key, it->second);
}

AgentConfig AgentConfig::from_store(const ConfigStore& store) {
    AgentConfig config;

    config.location = store.get_string("LOCATION_NAME", config.location);
    config.timezone = store.get_string("TIMEZONE", config.timezone);
    config.server_url = store.get_string("SERVER_URL", config.server_url);
    config.grid_voltage = store.get_double("VOLTAGE", config.grid_voltage);
    config.ct_rating = store.get_int("CT_RATING", config.ct_rating);

    require(!config.server_url.empty(), "SERVER_URL", "must not be empty");
    require(config.grid_voltage > 0, "VOLTAGE", "must be positive");
    require(config.ct_rating > 0, "CT_RATING", "must be positive");

    int send_interval = store.get_int("SEND_INTERVAL", static_cast<int>(config.send_interval.count()));
    int backoff = store.get_int("ERROR_BACKOFF", static_cast<int>(config.error_backoff.count()));
    int http_timeout = store.get_int("HTTP_TIMEOUT", static_cast<int>(config.http_timeout.count()));
    require(send_interval >= 0, "SEND_INTERVAL", "must not be negative");
    require(backoff >= 0, "ERROR_BACKOFF", "must not be negative");
    require(http_timeout >= 5 && http_timeout <= 10, "HTTP_TIMEOUT", "must be between 5 and 10 seconds");
    config.send_interval = std::chrono::seconds(send_interval);
    config.error_backoff = std::chrono::seconds(backoff);
    config.http_timeout = std::chrono::seconds(http_timeout);

    config.sampling.line_frequency = store.get_double("LINE_FREQUENCY", config.sampling.line_frequency);
    config.sampling.line_cycles = store.get_int("SAMPLE_CYCLES", config.sampling.line_cycles);
    int samples = store.get_int("NUM_SAMPLES", static_cast<int>(config.sampling.samples_per_channel));
    require(config.sampling.line_frequency > 0, "LINE_FREQUENCY", "must be positive");
    require(config.sampling.line_cycles > 0, "SAMPLE_CYCLES", "must be positive");
    require(samples >= static_cast<int>(PowerCalculator::MIN_SAMPLES), "NUM_SAMPLES",
            "must be at least " + std::to_string(PowerCalculator::MIN_SAMPLES));
    config.sampling.samples_per_channel = static_cast<size_t>(samples);

    config.spi_bus = store.get_int("SPI_BUS", config.spi_bus);
    config.spi_device = store.get_int("SPI_DEVICE", config.spi_device);
    int speed = store.get_int("SPI_SPEED_HZ", static_cast<int>(config.spi_speed_hz));
    require(config.spi_bus >= 0 && config.spi_device >= 0, "SPI_BUS/SPI_DEVICE", "must not be negative");
    require(speed > 0, "SPI_SPEED_HZ", "must be positive");
    config.spi_speed_hz = static_cast<uint32_t>(speed);

    int ct_count = store.get_int("CT_COUNT", static_cast<int>(MAX_CT_CHANNELS));
    require(ct_count >= 1 && ct_count <= static_cast<int>(MAX_CT_CHANNELS), "CT_COUNT", "must be between 1 and 6");

    bool default_reversed = store.get_bool("CT_REVERSED", true);
    double default_calibration = store.get_double("CT_CALIBRATION", 1.0);
    double volts_per_amp = PowerCalculator::volts_per_amp_for_rating(config.ct_rating);

    for (int slot = 1; slot <= ct_count; ++slot) {
        std::string prefix = "CT" + std::to_string(slot) + "_";

        ChannelConfig channel;
        channel.slot = slot;
        channel.adc_channel = store.get_int(prefix + "CHANNEL", slot - 1);
        channel.ct_rating = config.ct_rating;
        channel.volts_per_amp = volts_per_amp;
        channel.calibration = store.get_double(prefix + "CALIBRATION", default_calibration);
        channel.reversed = store.get_bool(prefix + "REVERSED", default_reversed);

        require(channel.adc_channel >= Mcp3008Reader::MIN_CHANNEL &&
                channel.adc_channel <= Mcp3008Reader::MAX_CHANNEL,
                prefix + "CHANNEL", "must be between 0 and 7");
        require(channel.calibration > 0, prefix + "CALIBRATION", "must be positive");

        config.channels.push_back(channel);
    }

    config.device_id = DeviceIdentity::resolve(store.get_string("DEVICE_ID", ""));
    return config;
}
