#include "pixel_budget/utils/logger.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdarg>

namespace pixel_budget {

namespace {
    const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
    const char* color_codes[] = {"\033[0;90m", "\033[0;36m", "\033[0;32m", "\033[0;33m", "\033[0;31m"};
    const char* reset_code = "\033[0m";
}

const char* log_level_to_string(LogLevel level) {
    return level_strings[static_cast<int>(level)];
}

LogLevel string_to_log_level(const std::string& str, LogLevel fallback) {
    for (int i = 0; i < 5; ++i) {
        if (str == level_strings[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    if (str.size() == 1 && str[0] >= '0' && str[0] <= '4') {
        return static_cast<LogLevel>(str[0] - '0');
    }
    return fallback;
}

Logger::Logger() {
    std::setvbuf(stdout, nullptr, _IONBF, 0);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::get_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_colors(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_ = enabled;
}

void Logger::set_stream(std::FILE* stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = (stream != nullptr) ? stream : stdout;
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::ERROR, fmt, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ > level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    const std::tm* local = std::localtime(&time_t);

    std::fprintf(stream_, "[%02d:%02d:%02d] ",
                 local->tm_hour, local->tm_min, local->tm_sec);

    if (colors_) {
        std::fprintf(stream_, "%s%s%s: ", color_codes[static_cast<int>(level)],
                     level_strings[static_cast<int>(level)], reset_code);
    } else {
        std::fprintf(stream_, "%s: ", level_strings[static_cast<int>(level)]);
    }

    std::vfprintf(stream_, fmt, args);
    std::fprintf(stream_, "\n");
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stream_);
}

} // namespace pixel_budget
