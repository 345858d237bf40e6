#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fairduel {
namespace common {

/**
 * @brief Logging levels
 *
 * Hot paths (round resolution, balance changes) log at DEBUG so that
 * production builds running at INFO pay only the level check.
 */
enum class LogLevel {
  TRACE = 0,
  DEBUG = 1,
  INFO = 2,
  WARN = 3,
  ERROR = 4,
  CRITICAL = 5
};

/// @brief Parse "trace".."critical" (any case); returns INFO for unknown input
LogLevel parse_log_level(const std::string &text);
const char *log_level_name(LogLevel level) noexcept;

/**
 * @brief Structured log entry
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string module;
  std::string thread_id;
  std::string message;
  std::string error_code;
  std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Interface for alerting channels fed by critical failures
 */
class IAlertChannel {
public:
  virtual ~IAlertChannel() = default;
  virtual void send_alert(const LogEntry &entry) = 0;
  virtual bool is_enabled() const = 0;
  virtual std::string get_name() const = 0;
};

/**
 * @brief Process-wide logger
 *
 * Thread-safe. Text or JSON line format, synchronous or drained by a
 * background worker. Entries at WARN and above go to stderr, the rest to
 * stdout.
 */
class Logger {
public:
  static Logger &instance() {
    static Logger logger;
    return logger;
  }

  void set_level(LogLevel level) noexcept {
    current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
  }

  LogLevel level() const noexcept {
    return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
  }

  void set_json_format(bool enabled) noexcept {
    json_format_.store(enabled, std::memory_order_relaxed);
  }

  void set_async_logging(bool enabled) {
    if (enabled && !async_enabled_.load()) {
      start_async_worker();
    } else if (!enabled && async_enabled_.load()) {
      stop_async_worker();
    }
  }

  void add_alert_channel(std::unique_ptr<IAlertChannel> channel) {
    std::lock_guard<std::mutex> lock(alert_mutex_);
    alert_channels_.push_back(std::move(channel));
  }

  bool is_enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           current_level_.load(std::memory_order_relaxed);
  }

  /// Log with an explicit module tag
  template <typename... Args>
  void log(LogLevel level, const std::string &module, Args &&...args) {
    if (!is_enabled(level))
      return;

    std::ostringstream oss;
    (oss << ... << args);

    process_log_entry(LogEntry{std::chrono::system_clock::now(), level, module,
                               get_thread_id(), oss.str(), "", {}});
  }

  void log_structured(
      LogLevel level, const std::string &module, const std::string &message,
      const std::string &error_code = "",
      const std::unordered_map<std::string, std::string> &context = {}) {
    if (!is_enabled(level))
      return;

    process_log_entry(LogEntry{std::chrono::system_clock::now(), level, module,
                               get_thread_id(), message, error_code, context});
  }

  /// Log a critical failure and fan it out to the alert channels
  void log_critical_failure(
      const std::string &module, const std::string &message,
      const std::string &error_code = "",
      const std::unordered_map<std::string, std::string> &context = {}) {
    LogEntry entry{std::chrono::system_clock::now(),
                   LogLevel::CRITICAL,
                   module,
                   get_thread_id(),
                   message,
                   error_code,
                   context};
    process_log_entry(entry);
    trigger_alerts(entry);
  }

  /// Block until the async queue is empty (no-op in synchronous mode)
  void flush();

private:
  Logger()
      : current_level_(static_cast<int>(LogLevel::INFO)), json_format_(false),
        async_enabled_(false), worker_shutdown_(false) {}

  ~Logger() { stop_async_worker(); }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  std::atomic<int> current_level_;
  std::atomic<bool> json_format_;
  std::atomic<bool> async_enabled_;
  std::atomic<bool> worker_shutdown_;

  static const size_t MAX_QUEUE_SIZE = 10000;
  std::queue<LogEntry> log_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable drained_cv_;
  std::thread worker_thread_;
  std::mutex output_mutex_;

  std::vector<std::unique_ptr<IAlertChannel>> alert_channels_;
  std::mutex alert_mutex_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point>
      last_alert_time_;
  static constexpr std::chrono::seconds ALERT_RATE_LIMIT_INTERVAL{60};

  void process_log_entry(const LogEntry &entry);
  void output_log_entry(const LogEntry &entry);
  void trigger_alerts(const LogEntry &entry);

  std::string get_thread_id() const;
  std::string format_json(const LogEntry &entry) const;
  std::string format_text(const LogEntry &entry) const;

  void start_async_worker();
  void stop_async_worker();
  void worker_loop();
};

} // namespace common
} // namespace fairduel

#define LOG_TRACE(module, ...)                                                 \
  do {                                                                         \
    if (fairduel::common::Logger::instance().is_enabled(                       \
            fairduel::common::LogLevel::TRACE)) {                              \
      fairduel::common::Logger::instance().log(                                \
          fairduel::common::LogLevel::TRACE, module, __VA_ARGS__);             \
    }                                                                          \
  } while (0)

#define LOG_DEBUG(module, ...)                                                 \
  do {                                                                         \
    if (fairduel::common::Logger::instance().is_enabled(                       \
            fairduel::common::LogLevel::DEBUG)) {                              \
      fairduel::common::Logger::instance().log(                                \
          fairduel::common::LogLevel::DEBUG, module, __VA_ARGS__);             \
    }                                                                          \
  } while (0)

#define LOG_INFO(module, ...)                                                  \
  fairduel::common::Logger::instance().log(fairduel::common::LogLevel::INFO,   \
                                           module, __VA_ARGS__)

#define LOG_WARN(module, ...)                                                  \
  fairduel::common::Logger::instance().log(fairduel::common::LogLevel::WARN,   \
                                           module, __VA_ARGS__)

#define LOG_ERROR(module, ...)                                                 \
  fairduel::common::Logger::instance().log(fairduel::common::LogLevel::ERROR,  \
                                           module, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...)                            \
  fairduel::common::Logger::instance().log_structured(level, module, message,  \
                                                      ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...)                             \
  fairduel::common::Logger::instance().log_critical_failure(module, message,   \
                                                            ##__VA_ARGS__)

#define LOG_STORE_ERROR(message, ...)                                          \
  LOG_CRITICAL_FAILURE("store", message, ##__VA_ARGS__)
