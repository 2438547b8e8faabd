#include "logger.hpp"

std::mutex Logger::output_mutex;
std::atomic<bool> Logger::quiet{false};
std::atomic<bool> Logger::verbose{false};

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%H:%M:%S");
    return ss.str();
}

void Logger::configure(bool quiet_mode, bool verbose_mode) {
    quiet.store(quiet_mode);
    verbose.store(verbose_mode);
}

void Logger::write(const char* prefix, const std::string& level, const std::string& msg) {
    std::string ts = timestamp();
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << prefix << "[" << ts << "] [" << level << "]" RESET " " << msg << std::endl;
}

void Logger::debug(const std::string& msg) {
    if (!verbose.load()) return;
    write(BLUE, "DEBUG", msg);
}

void Logger::info(const std::string& msg) {
    if (quiet.load()) return;
    write(CYAN, "INFO", msg);
}

void Logger::success(const std::string& msg) {
    if (quiet.load()) return;
    write(GREEN, "OK", msg);
}

void Logger::warning(const std::string& msg) {
    write(YELLOW, "WARN", msg);
}

void Logger::error(const std::string& msg) {
    write(RED, "ERROR", msg);
}

void Logger::alert(const std::string& msg) {
    write(RED BOLD, "ALERT", msg);
}
