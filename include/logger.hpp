#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace tokbench {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

const char* log_level_name(LogLevel level);
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Process-wide run log.
 *
 * Lines are written as "<timestamp> [LEVEL] message" to
 * <directory>/tokbench_<ddmmyyyy_HHMMSS>.log once configure() has been called,
 * and to stderr when console output is enabled or no file is open.
 * Safe to call from shard worker threads.
 */
class Logger {
private:
    std::ofstream log_file;
    std::string log_path;
    bool logging_enabled;
    bool console_enabled;
    LogLevel current_level;
    mutable std::mutex log_mutex;

    Logger();  // Private constructor for singleton

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance();

    // Opens a fresh log file under directory. Reconfiguring closes the previous file.
    void configure(const std::string& directory, LogLevel level, bool console);

    void log(const std::string& message);
    void log(const std::string& message, LogLevel level);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void enableLogging();
    void disableLogging();
    std::string getLogPath() const;
    ~Logger();
};

inline void log_debug(const std::string& message) { Logger::getInstance().log(message, LogLevel::DEBUG); }
inline void log_info(const std::string& message) { Logger::getInstance().log(message, LogLevel::INFO); }
inline void log_warning(const std::string& message) { Logger::getInstance().log(message, LogLevel::WARNING); }
inline void log_error(const std::string& message) { Logger::getInstance().log(message, LogLevel::ERROR); }

} // namespace tokbench
