// agent/sampler.hpp
#pragma once
#include "adc_reader.hpp"
#include "../common/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

struct SamplerSettings {
    double line_frequency{60.0};
    int line_cycles{8};
    size_t samples_per_channel{500};

    std::chrono::nanoseconds window() const;
};

class SynchronizedSampler {
private:
    ChannelReader& reader;
    SamplerSettings settings;
    size_t total_faults{0};

public:
    SynchronizedSampler(ChannelReader& reader, SamplerSettings settings);

    // One sequence per channel, in the order of `channels`. Slot i of every
    // channel is read before slot i+1 of any channel.
    std::vector<RawSampleSequence> collect(const std::vector<ChannelConfig>& channels);

    size_t get_total_faults() const { return total_faults; }
};
