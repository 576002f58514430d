// agent/supervisor.cpp
#include "supervisor.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

constexpr int LOW_VARIATION_CODES = 5;

}  // namespace

Supervisor::Supervisor(AgentConfig cfg,
                       std::unique_ptr<ChannelReader> hw,
                       std::unique_ptr<Uploader> up,
                       bool q)
    : config(std::move(cfg)),
      hardware(std::move(hw)),
      uploader(std::move(up)),
      sampler(*hardware, config.sampling),
      calculator(config.grid_voltage),
      builder(DeviceMetadata{config.device_id, config.location, config.timezone}, config.grid_voltage),
      quiet(q) {}

Supervisor::~Supervisor() {
    release_hardware();
}

bool Supervisor::start() {
    if (!hardware->open()) {
        Logger::alert("Cannot start without SPI. Check hardware connections.");
        done.store(true);
        release_hardware();
        return false;
    }

    started.store(true);
    std::stringstream ss;
    ss << "Service started - monitoring " << config.channels.size()
       << "x" << config.ct_rating << "A CT sensors";
    Logger::success(ss.str());
    return true;
}

SupervisorState Supervisor::get_state() const {
    return (started.load() && !done.load()) ? SupervisorState::Running : SupervisorState::Stopped;
}

void Supervisor::run(size_t max_cycles) {
    if (!started.load()) {
        Logger::error("Supervisor not started - call start() first");
        return;
    }

    size_t cycles = 0;
    while (!done.load()) {
        CycleOutcome outcome = run_cycle();
        cycles++;

        if (max_cycles > 0 && cycles >= max_cycles) break;
        if (done.load()) break;

        // No intra-cycle retry: a failed upload waits for the next cycle.
        auto pause = outcome == CycleOutcome::Fault ? config.error_backoff : config.send_interval;
        sleep_unless_stopped(std::chrono::duration_cast<std::chrono::milliseconds>(pause));
    }

    done.store(true);
    release_hardware();

    std::stringstream ss;
    ss << "Power Monitor stopped - readings ok=" << successful_readings
       << " failed=" << failed_readings
       << ", uploads ok=" << successful_uploads
       << " failed=" << failed_uploads;
    Logger::info(ss.str());
}

CycleOutcome Supervisor::run_cycle() {
    try {
        auto sequences = sampler.collect(config.channels);
        ChannelReadings readings = compute_readings(sequences);

        bool any = std::any_of(readings.begin(), readings.end(),
                               [](const std::optional<PowerReading>& r) { return r.has_value(); });
        if (!any) {
            failed_readings++;
            Logger::warning("No valid readings from any CT sensor");
            return CycleOutcome::NoReadings;
        }

        successful_readings++;
        log_channel_health(readings);

        TelemetryPayload payload = builder.build(readings, std::chrono::system_clock::now());
        json body = payload;
        UploadResult result = uploader->post(body.dump());

        std::string line = format_summary(readings) + " | " + result.describe();
        if (result.ok()) {
            successful_uploads++;
            if (!quiet) Logger::cycle_result(line);
            return CycleOutcome::Uploaded;
        }

        failed_uploads++;
        Logger::warning("Upload failed: " + line);
        return CycleOutcome::UploadFailed;
    } catch (const std::exception& e) {
        failed_readings++;
        Logger::error(std::string("Cycle failed: ") + e.what());
        return CycleOutcome::Fault;
    }
}

ChannelReadings Supervisor::compute_readings(const std::vector<RawSampleSequence>& sequences) {
    if (sequences.size() != config.channels.size()) {
        throw std::runtime_error("Sampler returned " + std::to_string(sequences.size()) +
                                 " sequences for " + std::to_string(config.channels.size()) + " channels");
    }

    ChannelReadings readings;
    for (size_t i = 0; i < config.channels.size(); ++i) {
        const ChannelConfig& channel = config.channels[i];
        readings[channel.slot - 1] = calculator.compute(sequences[i], channel);
        if (!readings[channel.slot - 1]) {
            Logger::debug("CT" + std::to_string(channel.slot) + " has only " +
                          std::to_string(sequences[i].size()) + " samples - no reading");
        }
    }
    return readings;
}

void Supervisor::log_channel_health(const ChannelReadings& readings) {
    if (!Logger::is_verbose()) return;

    for (size_t i = 0; i < readings.size(); ++i) {
        if (readings[i] && readings[i]->variation < LOW_VARIATION_CODES) {
            Logger::warning("CT" + std::to_string(i + 1) + " low current variation (" +
                            std::to_string(readings[i]->variation) + ") - check CT connection");
        }
    }
}

std::string Supervisor::format_summary(const ChannelReadings& readings) {
    std::stringstream active;
    double total_power = 0.0;
    bool first = true;

    active << std::fixed;
    for (size_t i = 0; i < readings.size(); ++i) {
        const auto& r = readings[i];
        if (!r || r->power <= 0) continue;

        total_power += r->power;
        if (!first) active << " | ";
        active << "CT" << (i + 1) << ":" << std::setprecision(1) << r->power
               << "W/" << std::setprecision(3) << r->current << "A";
        first = false;
    }

    if (first) return "No active loads detected";

    std::stringstream ss;
    ss << "Total:" << std::fixed << std::setprecision(1) << total_power << "W | " << active.str();
    return ss.str();
}

void Supervisor::sleep_unless_stopped(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!done.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - now, sleep_slice));
    }
}

void Supervisor::release_hardware() {
    if (hardware_released) return;
    hardware_released = true;
    hardware->close();
}
