// agent/power_calculator.cpp
#include "power_calculator.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

PowerCalculator::PowerCalculator(double voltage)
    : grid_voltage(voltage), vref(ADC_REFERENCE_VOLTAGE / ADC_FULL_SCALE) {}

double PowerCalculator::volts_per_amp_for_rating(int ct_rating) {
    switch (ct_rating) {
        case 30:  return 1.0 / 30;
        case 50:  return 1.0 / 50;
        case 100: return 0.9 / 100;  // SCT-T16 100A:50mA, 18 ohm burden
        case 200: return 1.0 / 200;
        default:  return 1.0 / ct_rating;
    }
}

double PowerCalculator::current_scaling(const ChannelConfig& channel) const {
    return (vref * channel.calibration * DEFAULT_CALIBRATION) / channel.volts_per_amp;
}

double PowerCalculator::ac_rms(const RawSampleSequence& samples) {
    if (samples.empty()) return 0.0;

    double sum = 0.0;
    double sum_squares = 0.0;
    for (int sample : samples) {
        sum += sample;
        sum_squares += static_cast<double>(sample) * sample;
    }

    double n = static_cast<double>(samples.size());
    double mean = sum / n;
    double mean_square = sum_squares / n;
    return std::sqrt(std::max(0.0, mean_square - mean * mean));
}

PolarityResult PowerCalculator::apply_polarity(double current, double power, bool reversed) {
    if (!reversed) return {current, power};

    if (power < 0) {
        return {current, std::fabs(power)};
    }
    return {-std::fabs(current), power};
}

double PowerCalculator::apply_noise_floor(double power) {
    return std::fabs(power) < NOISE_FLOOR_W ? 0.0 : power;
}

std::optional<PowerReading> PowerCalculator::compute(const RawSampleSequence& samples,
                                                     const ChannelConfig& channel) const {
    if (samples.size() < MIN_SAMPLES) {
        return std::nullopt;
    }

    double scaling = current_scaling(channel);
    double current_rms = ac_rms(samples) * scaling;
    double power_calculated = grid_voltage * std::fabs(current_rms) * ASSUMED_POWER_FACTOR;

    auto corrected = apply_polarity(current_rms, power_calculated, channel.reversed);
    double final_power = apply_noise_floor(corrected.power);

    double apparent = grid_voltage * std::fabs(corrected.current);
    double pf = apparent > MIN_APPARENT_VA ? ASSUMED_POWER_FACTOR : 0.0;

    auto bounds = std::minmax_element(samples.begin(), samples.end());
    int variation = *bounds.second - *bounds.first;

    if (Logger::is_verbose()) {
        std::stringstream ss;
        ss << "CT" << channel.slot << " ADC min=" << *bounds.first
           << " max=" << *bounds.second
           << " variation=" << variation
           << " samples=" << samples.size()
           << std::fixed << std::setprecision(3)
           << " scaling=" << scaling
           << " rms=" << std::fabs(current_rms) << "A";
        Logger::debug(ss.str());
    }

    PowerReading reading;
    reading.power = std::fabs(final_power);
    reading.current = std::fabs(corrected.current);
    reading.voltage = grid_voltage;
    reading.power_factor = pf;
    reading.variation = variation;
    return reading;
}
