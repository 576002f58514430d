// agent/payload_builder.cpp
#include "payload_builder.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

PayloadBuilder::PayloadBuilder(DeviceMetadata m, double voltage)
    : metadata(std::move(m)), grid_voltage(voltage) {}

double PayloadBuilder::round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::string PayloadBuilder::format_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

TelemetryPayload PayloadBuilder::build(const ChannelReadings& readings,
                                       std::chrono::system_clock::time_point now) const {
    TelemetryPayload payload;
    payload.device_id = metadata.device_id;
    payload.timestamp = format_timestamp(now);
    payload.location = metadata.location;
    payload.timezone = metadata.timezone;
    payload.voltage_rms = round_to(grid_voltage, 1);

    for (size_t i = 0; i < MAX_CT_CHANNELS; ++i) {
        const auto& reading = readings[i];
        if (reading) {
            payload.cts[i] = {round_to(reading->power, 1),
                              round_to(reading->current, 3),
                              round_to(reading->power_factor, 3)};
        } else {
            payload.cts[i] = {0.0, 0.0, 0.0};
        }
    }
    return payload;
}

void to_json(json& j, const ChannelView& view) {
    j = json{{"real_power_w", view.real_power_w},
             {"amps", view.amps},
             {"pf", view.pf}};
}

void to_json(json& j, const TelemetryPayload& payload) {
    json cts = json::object();
    for (size_t i = 0; i < MAX_CT_CHANNELS; ++i) {
        cts["ct_" + std::to_string(i + 1)] = payload.cts[i];
    }

    j = json{{"device_id", payload.device_id},
             {"timestamp", payload.timestamp},
             {"location", payload.location},
             {"readings", {{"cts", cts}, {"voltage_rms", payload.voltage_rms}}}};

    if (!payload.timezone.empty()) {
        j["timezone"] = payload.timezone;
    }
}
