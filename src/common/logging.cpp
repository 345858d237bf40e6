#include "common/logging.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>

namespace fairduel {
namespace common {

LogLevel parse_log_level(const std::string &text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "CRITICAL")
    return LogLevel::CRITICAL;
  return LogLevel::INFO;
}

const char *log_level_name(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::get_thread_id() const {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

void Logger::process_log_entry(const LogEntry &entry) {
  if (async_enabled_.load()) {
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (log_queue_.size() >= MAX_QUEUE_SIZE) {
        log_queue_.pop();
      }
      log_queue_.push(entry);
    }
    queue_cv_.notify_one();
  } else {
    output_log_entry(entry);
  }
}

void Logger::output_log_entry(const LogEntry &entry) {
  std::string line =
      json_format_.load() ? format_json(entry) : format_text(entry);
  std::lock_guard<std::mutex> lock(output_mutex_);
  if (entry.level >= LogLevel::WARN) {
    std::cerr << line << std::endl;
  } else {
    std::cout << line << '\n';
  }
}

void Logger::trigger_alerts(const LogEntry &entry) {
  std::lock_guard<std::mutex> lock(alert_mutex_);

  std::string rate_key = entry.module + ":" + entry.error_code;
  auto now = std::chrono::steady_clock::now();
  auto it = last_alert_time_.find(rate_key);
  if (it != last_alert_time_.end() &&
      now - it->second < ALERT_RATE_LIMIT_INTERVAL) {
    return;
  }
  last_alert_time_[rate_key] = now;

  for (auto &channel : alert_channels_) {
    if (!channel->is_enabled())
      continue;
    try {
      channel->send_alert(entry);
    } catch (const std::exception &e) {
      // stderr, not the logger itself, to avoid recursion
      std::cerr << "Alert channel '" << channel->get_name()
                << "' failed: " << e.what() << std::endl;
    }
  }
}

std::string Logger::format_json(const LogEntry &entry) const {
  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm tm_utc{};
  gmtime_r(&time_t, &tm_utc);

  std::ostringstream timestamp;
  timestamp << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << "."
            << std::setfill('0') << std::setw(3) << ms.count() << "Z";

  nlohmann::json line{{"timestamp", timestamp.str()},
                      {"level", log_level_name(entry.level)},
                      {"module", entry.module},
                      {"thread_id", entry.thread_id},
                      {"message", entry.message}};
  if (!entry.error_code.empty()) {
    line["error_code"] = entry.error_code;
  }
  if (!entry.context.empty()) {
    line["context"] = entry.context;
  }
  // Invalid UTF-8 in a message must not throw out of the logger
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm tm_local{};
  localtime_r(&time_t, &tm_local);

  text << "[" << std::put_time(&tm_local, "%Y-%m-%d %H:%M:%S") << "] ["
       << log_level_name(entry.level) << "] [" << entry.module << "] "
       << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

void Logger::flush() {
  if (!async_enabled_.load()) {
    std::cout.flush();
    return;
  }
  std::unique_lock<std::mutex> lock(queue_mutex_);
  drained_cv_.wait_for(lock, std::chrono::seconds(5),
                       [this] { return log_queue_.empty(); });
}

void Logger::start_async_worker() {
  if (async_enabled_.load())
    return;

  worker_shutdown_.store(false);
  async_enabled_.store(true);
  worker_thread_ = std::thread(&Logger::worker_loop, this);
}

void Logger::stop_async_worker() {
  if (!async_enabled_.load())
    return;

  worker_shutdown_.store(true);
  queue_cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  async_enabled_.store(false);

  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!log_queue_.empty()) {
    output_log_entry(log_queue_.front());
    log_queue_.pop();
  }
  drained_cv_.notify_all();
}

void Logger::worker_loop() {
  while (!worker_shutdown_.load()) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_cv_.wait(lock, [this] {
      return !log_queue_.empty() || worker_shutdown_.load();
    });

    while (!log_queue_.empty()) {
      auto entry = log_queue_.front();
      log_queue_.pop();
      lock.unlock();

      output_log_entry(entry);

      lock.lock();
    }
    drained_cv_.notify_all();
  }
}

} // namespace common
} // namespace fairduel
