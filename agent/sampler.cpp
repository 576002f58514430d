// agent/sampler.cpp
#include "sampler.hpp"
#include "logger.hpp"
#include <thread>

std::chrono::nanoseconds SamplerSettings::window() const {
    std::chrono::duration<double> seconds(line_cycles / line_frequency);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(seconds);
}

SynchronizedSampler::SynchronizedSampler(ChannelReader& r, SamplerSettings s)
    : reader(r), settings(s) {}

std::vector<RawSampleSequence> SynchronizedSampler::collect(const std::vector<ChannelConfig>& channels) {
    std::vector<RawSampleSequence> sequences(channels.size());
    for (auto& sequence : sequences) {
        sequence.reserve(settings.samples_per_channel);
    }

    const size_t slots = settings.samples_per_channel;
    if (slots == 0 || channels.empty()) return sequences;

    const std::chrono::nanoseconds slot_interval(
        settings.window().count() / static_cast<std::chrono::nanoseconds::rep>(slots));
    size_t faults = 0;

    auto start = std::chrono::steady_clock::now();
    for (size_t i = 0; i < slots; ++i) {
        for (size_t c = 0; c < channels.size(); ++c) {
            int code = reader.read(channels[c].adc_channel);
            if (code >= 0) {
                sequences[c].push_back(code);
            } else {
                faults++;
            }
        }

        // sleep_until returns immediately when the slot already overran
        std::this_thread::sleep_until(start + slot_interval * static_cast<std::chrono::nanoseconds::rep>(i + 1));
    }

    if (faults > 0) {
        total_faults += faults;
        Logger::debug("Sampling pass dropped " + std::to_string(faults) + " faulted reads");
    }
    return sequences;
}
