#pragma once
#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <atomic>
#include <mutex>

#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

class Logger {
private:
    static std::mutex output_mutex;
    static std::atomic<bool> quiet;
    static std::atomic<bool> verbose;

    static void write(const char* prefix, const std::string& level, const std::string& msg);

public:
    static std::string timestamp();

    // quiet drops info/success; verbose enables debug
    static void configure(bool quiet_mode, bool verbose_mode);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void success(const std::string& msg);
    static void warning(const std::string& msg);
    static void error(const std::string& msg);
    static void alert(const std::string& msg);
};
