#include "logger.hpp"

std::atomic<bool> Logger::verbose{false};

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::set_verbose(bool enabled) {
    verbose.store(enabled);
}

bool Logger::is_verbose() {
    return verbose.load();
}

void Logger::info(const std::string& msg) {
    std::cout << CYAN "[" << timestamp() << "] [INFO]" RESET " " << msg << std::endl;
}

void Logger::success(const std::string& msg) {
    std::cout << GREEN "[" << timestamp() << "] [OK]" RESET " " << msg << std::endl;
}

void Logger::warning(const std::string& msg) {
    std::cout << YELLOW "[" << timestamp() << "] [WARN]" RESET " " << msg << std::endl;
}

void Logger::error(const std::string& msg) {
    std::cout << RED "[" << timestamp() << "] [ERROR]" RESET " " << msg << std::endl;
}

void Logger::alert(const std::string& msg) {
    std::cout << RED BOLD "[" << timestamp() << "] [ALERT]" RESET " " << msg << std::endl;
}

void Logger::debug(const std::string& msg) {
    if (!verbose.load()) return;
    std::cout << BLUE "[" << timestamp() << "] [DEBUG]" RESET " " << msg << std::endl;
}

void Logger::cycle_result(const std::string& msg) {
    std::cout << GREEN BOLD "[" << timestamp() << "] [CYCLE]" RESET " " << msg << std::endl;
}
