#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #define isatty _isatty
    #define fileno _fileno
    #ifdef ERROR
        #undef ERROR
    #endif
#else
    #include <unistd.h>
#endif

namespace qtm {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
    is_terminal_ = isatty(fileno(stdout)) != 0;

#ifdef _WIN32
    if (is_terminal_) {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, dwMode);
    }
#endif
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    if (sink_) {
        std::string line = "[" + std::string(get_level_string(level)) + "]";
        if (!module.empty()) {
            line += " [" + module + "]";
        }
        line += " " + message;
        sink_(level, module, line);
        return;
    }

    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        std::time_t now_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
#ifdef _WIN32
        localtime_s(&local_tm, &now_t);
#else
        localtime_r(&now_t, &local_tm);
#endif
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();

    if (!module.empty()) {
        oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
    }

    oss << " " << message << '\n';

    // Errors go to stderr so they survive stdout redirection of the summary
    std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;
    out << oss.str();
    out.flush();
}

const char* Logger::get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

const char* Logger::get_color_code(LogLevel level) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

const char* Logger::get_module_color(const std::string& module) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
    };

    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

const char* Logger::get_reset_code() const {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::WARN;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

} // namespace qtm
