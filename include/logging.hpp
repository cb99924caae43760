#pragma once
#include <cstdio>
#include <cstdarg>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace zxboot {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

std::optional<LogLevel> parse_log_level(const std::string& s);

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    // Additional destination for messages at or above 'min_level'.
    // The sink is not invoked for messages it logs itself.
    void set_sink(Sink sink, LogLevel min_level = LogLevel::WARN);
    void clear_sink();
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
    LogLevel sink_level_ = LogLevel::WARN;
    const char* level_str(LogLevel lvl);
};

} // namespace zxboot
