// agent/payload_builder.hpp
#pragma once
#include "../common/protocol.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct DeviceMetadata {
    std::string device_id;
    std::string location;
    std::string timezone;
};

class PayloadBuilder {
private:
    DeviceMetadata metadata;
    double grid_voltage;

public:
    PayloadBuilder(DeviceMetadata metadata, double grid_voltage);

    TelemetryPayload build(const ChannelReadings& readings,
                           std::chrono::system_clock::time_point now) const;

    static double round_to(double value, int decimals);
    static std::string format_timestamp(std::chrono::system_clock::time_point tp);
};

void to_json(json& j, const ChannelView& view);
void to_json(json& j, const TelemetryPayload& payload);
