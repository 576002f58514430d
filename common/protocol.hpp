#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

constexpr size_t MAX_CT_CHANNELS = 6;
constexpr int ADC_FAULT = -1;

struct ChannelConfig {
    int slot;               // 1..6, position in the payload
    int adc_channel;        // 0..7, MCP3008 input
    int ct_rating;          // amps
    double volts_per_amp;
    double calibration;
    bool reversed;
};

using RawSampleSequence = std::vector<int>;

struct PowerReading {
    double power;
    double current;
    double voltage;
    double power_factor;
    int variation;          // max - min of raw codes, diagnostics only
};

using ChannelReadings = std::array<std::optional<PowerReading>, MAX_CT_CHANNELS>;

struct ChannelView {
    double real_power_w;
    double amps;
    double pf;
};

struct TelemetryPayload {
    std::string device_id;
    std::string timestamp;
    std::string location;
    std::string timezone;
    double voltage_rms;
    std::array<ChannelView, MAX_CT_CHANNELS> cts;
};

enum class UploadStatus {
    Success,
    Timeout,
    ConnectionFailed,
    HttpError,
    Error
};

struct UploadResult {
    UploadStatus status;
    long http_code{0};
    std::string detail;

    bool ok() const { return status == UploadStatus::Success; }
    std::string describe() const;
};

enum class CycleOutcome {
    Uploaded,
    UploadFailed,
    NoReadings,
    Fault
};
