#pragma once

#include <string>
#include <cstdarg>
#include <functional>

struct LoggingConfig;

class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };
    using Sink = std::function<void(Level, const char*)>;

    static void begin(const LoggingConfig& cfg);
    static void setLevel(Level level);
    static Level level();
    static void setSink(Sink sink);
    static void log(Level level, const char* fmt, ...);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static const char* levelName(Level level);
private:
    static Level min_level_;
    static Sink sink_;
    static void write_log(Level level, const char* fmt, va_list args);
};
