#pragma once
#include <string>
#include <mutex>
#include <cstdio>
#include <cstdarg>

namespace pixel_budget {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

const char* log_level_to_string(LogLevel level);
LogLevel string_to_log_level(const std::string& str, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void set_colors(bool enabled);
    // nullptr restores stdout
    void set_stream(std::FILE* stream);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
    void flush();
private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    bool colors_ = true;
    std::FILE* stream_ = stdout;
    mutable std::mutex mutex_;
};

} // namespace pixel_budget
