#ifndef DLR_LOGGER_HPP
#define DLR_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

enum class LogLevel {
    INFO,
    WARNING,
    ERROR,
    DEBUG
};

class Logger {
public:
    static Logger& instance();

    void init(const std::string& filename);
    void log(LogLevel level, const std::string& message);

    // DEBUG lines are dropped unless debug output is enabled
    void set_debug(bool enabled) { debug_enabled_ = enabled; }
    bool debug_enabled() const { return debug_enabled_; }

    void set_console(bool enabled) { console_enabled_ = enabled; }

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args... args) {
        if (level == LogLevel::DEBUG && !debug_enabled_) {
            return;
        }
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    std::mutex mutex_;
    std::atomic<bool> debug_enabled_{false};
    std::atomic<bool> console_enabled_{true};

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // DLR_LOGGER_HPP
