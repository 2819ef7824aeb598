#include "../include/logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tokbench {

namespace {

std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);
    std::stringstream datetime;
    datetime << std::put_time(&local_tm, pattern);
    return datetime.str();
}

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

Logger::Logger() : logging_enabled(true), console_enabled(false), current_level(LogLevel::INFO) {}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const std::string& directory, LogLevel level, bool console) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    console_enabled = console;

    if (log_file.is_open()) {
        log_file.close();
    }

    // Create logs directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << directory << ": " << ec.message() << std::endl;
        log_path.clear();
        return;
    }

    log_path = (std::filesystem::path(directory) / ("tokbench_" + format_now("%d%m%Y_%H%M%S") + ".log")).string();
    log_file.open(log_path, std::ios::out | std::ios::app);
    if (!log_file.is_open()) {
        std::cerr << "Failed to open log file: " << log_path << std::endl;
        log_path.clear();
    } else {
        log_file << "=== Log started at: " << format_now("%d-%m-%Y %H:%M:%S") << " ===" << std::endl;
    }
}

void Logger::log(const std::string& message) {
    log(message, LogLevel::INFO);
}

void Logger::log(const std::string& message, LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!logging_enabled || level < current_level) return;

    std::string line = format_now("%Y-%m-%d %H:%M:%S") + " [" + log_level_name(level) + "] " + message;

    if (log_file.is_open()) {
        log_file << line << '\n';
        log_file.flush();
    }
    if (console_enabled || !log_file.is_open()) {
        std::cerr << line << std::endl;
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return current_level;
}

void Logger::enableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = true;
}

void Logger::disableLogging() {
    std::lock_guard<std::mutex> lock(log_mutex);
    logging_enabled = false;
}

std::string Logger::getLogPath() const {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_path;
}

Logger::~Logger() {
    if (log_file.is_open()) {
        log_file.close();
    }
}

} // namespace tokbench
