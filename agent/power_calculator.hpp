// agent/power_calculator.hpp
#pragma once

#include "../common/protocol.hpp"
#include <cstddef>
#include <optional>

struct PolarityResult {
    double current;
    double power;
};

class PowerCalculator {
private:
    double grid_voltage;
    double vref;

public:
    static constexpr double ADC_REFERENCE_VOLTAGE = 3.31;
    static constexpr double ADC_FULL_SCALE = 1024.0;
    static constexpr double DEFAULT_CALIBRATION = 0.88;
    static constexpr double ASSUMED_POWER_FACTOR = 0.90;
    static constexpr double NOISE_FLOOR_W = 1.0;
    static constexpr double MIN_APPARENT_VA = 0.1;
    static constexpr size_t MIN_SAMPLES = 100;

    explicit PowerCalculator(double grid_voltage);

    // Empty when the sequence is too short to trust.
    std::optional<PowerReading> compute(const RawSampleSequence& samples,
                                        const ChannelConfig& channel) const;

    double current_scaling(const ChannelConfig& channel) const;

    static double volts_per_amp_for_rating(int ct_rating);
    static double ac_rms(const RawSampleSequence& samples);
    static PolarityResult apply_polarity(double current, double power, bool reversed);
    static double apply_noise_floor(double power);
};
