#include "logging.hpp"
#include <chrono>
#include <ctime>

namespace zxboot {

namespace {
thread_local bool in_sink = false;

struct SinkGuard {
  SinkGuard() { in_sink = true; }
  ~SinkGuard() { in_sink = false; }
};
} // namespace

std::optional<LogLevel> parse_log_level(const std::string &s) {
  if (s == "trace")
    return LogLevel::TRACE;
  if (s == "debug")
    return LogLevel::DEBUG;
  if (s == "info")
    return LogLevel::INFO;
  if (s == "warn")
    return LogLevel::WARN;
  if (s == "error")
    return LogLevel::ERROR;
  return std::nullopt;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(Sink sink, LogLevel min_level) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = std::move(sink);
  sink_level_ = min_level;
}

void Logger::clear_sink() {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = nullptr;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (lvl < level_ && (!sink_ || lvl < sink_level_))
      return;
  }
  char msg[512];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  Sink sink;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (lvl >= level_) {
      using namespace std::chrono;
      auto now = system_clock::now();
      auto t = system_clock::to_time_t(now);
      char ts[32];
      std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", std::localtime(&t));
      std::fprintf(stderr, "%s [%s] %s\n", ts, level_str(lvl), msg);
    }
    if (sink_ && lvl >= sink_level_ && !in_sink)
      sink = sink_;
  }
  if (sink) {
    SinkGuard guard;
    sink(lvl, msg);
  }
}

} // namespace zxboot
