#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace pitwall {
namespace log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Fatal,
  Off
};

// Thread-safe process-wide logger. Writes to stdout unless redirected.
class Logger {
public:
  static Logger& instance() {
    static Logger inst;
    return inst;
  }

  void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }
  Level level() const noexcept { return level_.load(std::memory_order_relaxed); }
  bool enabled(Level lvl) const noexcept {
    const Level cur = level();
    return lvl >= cur && cur != Level::Off;
  }

  void enable_color(bool on) noexcept { color_.store(on, std::memory_order_relaxed); }

  void set_output(std::ostream* os) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = os ? os : &std::cout;
  }

  void write(Level lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto& os = *out_;
    const bool color = color_.load(std::memory_order_relaxed);
    if (color) os << color_code_(lvl);
    os << timestamp_() << " [" << level_name(lvl) << "] " << msg;
    if (color) os << "\033[0m";
    os << '\n';
    os.flush();
  }

  static const char* level_name(Level lvl) {
    switch (lvl) {
      case Level::Trace: return "TRACE";
      case Level::Debug: return "DEBUG";
      case Level::Info:  return "INFO";
      case Level::Warn:  return "WARN";
      case Level::Error: return "ERROR";
      case Level::Fatal: return "FATAL";
      case Level::Off:   return "OFF";
    }
    return "?????";
  }

private:
  Logger() = default;

  static const char* color_code_(Level lvl) {
    switch (lvl) {
      case Level::Trace: return "\033[37m";
      case Level::Debug: return "\033[36m";
      case Level::Info:  return "\033[32m";
      case Level::Warn:  return "\033[33m";
      case Level::Error: return "\033[31m";
      case Level::Fatal: return "\033[1;31m";
      case Level::Off:   break;
    }
    return "\033[0m";
  }

  // HH:MM:SS.mmm local time
  static std::string timestamp_() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
    return buf;
  }

  std::ostream* out_{&std::cout};
  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> color_{false};
  std::mutex mutex_;
};

// Collects operator<< pieces and emits one line on destruction.
class LogStream {
public:
  explicit LogStream(Level lvl) : lvl_(lvl) {}
  ~LogStream() { Logger::instance().write(lvl_, ss_.str()); }

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& v) {
    ss_ << v;
    return *this;
  }

private:
  Level lvl_;
  std::ostringstream ss_;
};

// Parses "trace|debug|info|warn|error|fatal|off"; returns false if unknown.
inline bool parse_level(std::string_view s, Level& out) {
  if (s == "trace") { out = Level::Trace; return true; }
  if (s == "debug") { out = Level::Debug; return true; }
  if (s == "info")  { out = Level::Info;  return true; }
  if (s == "warn")  { out = Level::Warn;  return true; }
  if (s == "error") { out = Level::Error; return true; }
  if (s == "fatal") { out = Level::Fatal; return true; }
  if (s == "off")   { out = Level::Off;   return true; }
  return false;
}

} // namespace log
} // namespace pitwall

// The level check happens before the message is formatted.
#define PW_LOG_LEVEL(lvl, msg) \
  do { \
    if (::pitwall::log::Logger::instance().enabled(lvl)) { \
      ::pitwall::log::LogStream(lvl) << msg; \
    } \
  } while (0)

#define PW_TRACE(msg) PW_LOG_LEVEL(::pitwall::log::Level::Trace, msg)
#define PW_DEBUG(msg) PW_LOG_LEVEL(::pitwall::log::Level::Debug, msg)
#define PW_INFO(msg)  PW_LOG_LEVEL(::pitwall::log::Level::Info,  msg)
#define PW_WARN(msg)  PW_LOG_LEVEL(::pitwall::log::Level::Warn,  msg)
#define PW_ERROR(msg) PW_LOG_LEVEL(::pitwall::log::Level::Error, msg)
#define PW_FATAL(msg) PW_LOG_LEVEL(::pitwall::log::Level::Fatal, msg)
