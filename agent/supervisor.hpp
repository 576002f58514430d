// agent/supervisor.hpp
#pragma once
#include "adc_reader.hpp"
#include "config.hpp"
#include "payload_builder.hpp"
#include "power_calculator.hpp"
#include "sampler.hpp"
#include "upload_client.hpp"
#include "../common/protocol.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

enum class SupervisorState {
    Running,
    Stopped
};

class Supervisor {
private:
    AgentConfig config;
    std::unique_ptr<ChannelReader> hardware;
    std::unique_ptr<Uploader> uploader;
    SynchronizedSampler sampler;
    PowerCalculator calculator;
    PayloadBuilder builder;
    bool quiet;

    std::atomic<bool> done{false};
    std::atomic<bool> started{false};
    bool hardware_released{false};

    size_t successful_readings{0};
    size_t failed_readings{0};
    size_t successful_uploads{0};
    size_t failed_uploads{0};

    std::chrono::milliseconds sleep_slice{200};

    ChannelReadings compute_readings(const std::vector<RawSampleSequence>& sequences);
    void log_channel_health(const ChannelReadings& readings);
    void sleep_unless_stopped(std::chrono::milliseconds duration);
    void release_hardware();

public:
    Supervisor(AgentConfig config,
               std::unique_ptr<ChannelReader> hardware,
               std::unique_ptr<Uploader> uploader,
               bool quiet = false);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    bool start();
    // Runs until stopped; max_cycles == 0 means no limit.
    void run(size_t max_cycles = 0);
    CycleOutcome run_cycle();

    // Only touches an atomic flag; safe from a signal handler.
    void request_stop() { done.store(true); }

    SupervisorState get_state() const;
    size_t get_successful_readings() const { return successful_readings; }
    size_t get_failed_readings() const { return failed_readings; }
    size_t get_successful_uploads() const { return successful_uploads; }
    size_t get_failed_uploads() const { return failed_uploads; }

    void set_sleep_slice(std::chrono::milliseconds slice) { sleep_slice = slice; }

    static std::string format_summary(const ChannelReadings& readings);
};
