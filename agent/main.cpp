// agent/main.cpp
#include "supervisor.hpp"
#include "logger.hpp"
#include <iostream>
#include <string>
#include <csignal>
#include <memory>

namespace {

std::atomic<Supervisor*> active_supervisor{nullptr};

void signal_handler(int) {
    Supervisor* supervisor = active_supervisor.load();
    if (supervisor) {
        supervisor->request_stop();
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  -c, --config FILE           Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "      --once                  Run a single sampling/upload cycle and exit\n"
              << "      --quiet                 Suppress per-cycle summaries\n"
              << "  -v, --verbose               Log per-channel diagnostics\n"
              << "  -h, --help                  Show this help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool once = false;
    bool quiet = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    Logger::set_verbose(verbose);

    AgentConfig config;
    std::unique_ptr<Uploader> uploader;
    try {
        config = AgentConfig::from_store(ConfigStore::load_file(config_path));
        uploader = std::make_unique<HttpUploadClient>(
            config.server_url, std::chrono::duration_cast<std::chrono::milliseconds>(config.http_timeout));
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    std::cout << CYAN BOLD "Power Monitor Agent - " << config.location << RESET << std::endl;
    std::cout << CYAN "Device ID: " << config.device_id
              << ", Voltage: " << config.grid_voltage << "V"
              << ", CT Rating: " << config.ct_rating << "A x" << config.channels.size()
              << ", Server: " << config.server_url
              << (config.timezone.empty() ? std::string() : ", Timezone: " + config.timezone)
              << RESET << std::endl;

    auto hardware = std::make_unique<Mcp3008Reader>(config.spi_bus, config.spi_device, config.spi_speed_hz);
    Supervisor supervisor(std::move(config), std::move(hardware), std::move(uploader), quiet);

    active_supervisor.store(&supervisor);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!supervisor.start()) {
        active_supervisor.store(nullptr);
        return 1;
    }

    supervisor.run(once ? 1 : 0);
    active_supervisor.store(nullptr);

    Logger::info("Shutdown complete");
    return 0;
}
