#include "../include/logger.hpp"
#include "../include/config_manager.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <mutex>

Logger::Level Logger::min_level_ = Logger::INFO;
Logger::Sink Logger::sink_;

static std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

void Logger::begin(const LoggingConfig& cfg) {
    min_level_ = Logger::INFO;
    if (!cfg.log_level.empty()) {
        if (strcmp(cfg.log_level.c_str(), "DEBUG") == 0) min_level_ = Logger::DEBUG;
        else if (strcmp(cfg.log_level.c_str(), "INFO") == 0) min_level_ = Logger::INFO;
        else if (strcmp(cfg.log_level.c_str(), "WARN") == 0) min_level_ = Logger::WARN;
        else if (strcmp(cfg.log_level.c_str(), "ERROR") == 0) min_level_ = Logger::ERROR;
    }
}

void Logger::setLevel(Level level) { min_level_ = level; }

Logger::Level Logger::level() { return min_level_; }

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    sink_ = sink;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Logger::DEBUG: return "DEBUG";
        case Logger::INFO:  return "INFO";
        case Logger::WARN:  return "WARN";
        case Logger::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[256];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);

    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm tm_utc;
    gmtime_r(&secs, &tm_utc);
    char time_buf[32];
    size_t n = strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", &tm_utc);
    snprintf(time_buf + n, sizeof(time_buf) - n, ".%03ld", ms);

    std::lock_guard<std::mutex> lock(logMutex());
    if (sink_) {
        sink_(level, buf);
        return;
    }
    printf("[%s] [%s] %s\n", time_buf, levelName(level), buf);
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}
