#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <functional>
#include <cstdint>

#ifdef _WIN32
    // Undefine Windows ERROR macro to avoid conflicts with our enum
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace qtm {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Receives every formatted line that passes the level filter instead of
 * stdout/stderr. The line carries no trailing newline and no color codes.
 */
using LogSink = std::function<void(LogLevel level, const std::string& module, const std::string& line)>;

class Logger {
public:
    // Singleton pattern
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level();

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    // Redirect output; pass nullptr to go back to the console
    void set_sink(LogSink sink);

    // Main logging function
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    static const char* get_level_string(LogLevel level);
    const char* get_color_code(LogLevel level) const;
    const char* get_module_color(const std::string& module) const;
    const char* get_reset_code() const;

    std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
    LogSink sink_;
};

/**
 * Parse a level name ("debug", "info", "warn", "error"), case-insensitive.
 * @return false if the name is not recognised
 */
bool parse_log_level(const std::string& name, LogLevel& out);

} // namespace qtm

// Convenience macros for easy logging
#define LOG_DEBUG(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        qtm::Logger::getInstance().log(qtm::LogLevel::DEBUG, module, oss.str()); \
    } while(0)

#define LOG_INFO(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        qtm::Logger::getInstance().log(qtm::LogLevel::INFO, module, oss.str()); \
    } while(0)

#define LOG_WARN(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        qtm::Logger::getInstance().log(qtm::LogLevel::WARN, module, oss.str()); \
    } while(0)

#define LOG_ERROR(module, message) \
    do { \
        std::ostringstream oss; \
        oss << message; \
        qtm::Logger::getInstance().log(qtm::LogLevel::ERROR, module, oss.str()); \
    } while(0)
