#pragma once

#include "common/types.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fairduel {
namespace notify {

using namespace fairduel::common;

enum class NotificationType {
  OPPONENT_FOUND,        ///< Owner: somebody joined, confirm within the window
  CONFIRMATION_REQUIRED, ///< Joiner: waiting for the owner
  CONFIRMATION_EXPIRED,
  ROUND_STARTED,
  ROUND_RESULT,
  OPPONENT_FORFEITED,
  SERIES_COMPLETED
};

const char *notification_type_name(NotificationType type) noexcept;

struct Notification {
  NotificationType type = NotificationType::ROUND_RESULT;
  UserId user_id;
  std::string message;
  std::unordered_map<std::string, std::string> context;
  TimestampMs created_at = 0;
};

/**
 * @brief Delivery channel for player notifications
 *
 * Implementations must be thread-safe; the dispatcher may call deliver()
 * from its worker thread.
 */
class INotificationSink {
public:
  virtual ~INotificationSink() = default;
  virtual void deliver(const Notification &notification) = 0;
  virtual std::string get_name() const = 0;
};

/// Writes every notification to the Logger at INFO
class LoggingNotificationSink : public INotificationSink {
public:
  void deliver(const Notification &notification) override;
  std::string get_name() const override { return "log"; }
};

/**
 * @brief Fans notifications out to the registered sinks
 *
 * Notifications are published from store commit hooks, so publish() never
 * blocks on a sink. In async mode a single worker drains the queue in
 * publication order; flush() waits until it is empty.
 */
class NotificationDispatcher {
public:
  explicit NotificationDispatcher(bool async_delivery = true);
  ~NotificationDispatcher();

  NotificationDispatcher(const NotificationDispatcher &) = delete;
  NotificationDispatcher &operator=(const NotificationDispatcher &) = delete;

  void add_sink(std::shared_ptr<INotificationSink> sink);
  void publish(Notification notification);

  /// Block until every queued notification has been delivered
  void flush();
  void shutdown();

  uint64_t published_count() const {
    return published_.load(std::memory_order_relaxed);
  }

private:
  bool async_delivery_;
  std::vector<std::shared_ptr<INotificationSink>> sinks_;
  std::mutex sinks_mutex_;

  std::queue<Notification> queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable drained_cv_;
  bool in_flight_ = false;
  bool shutdown_ = false;
  std::thread worker_;
  std::atomic<uint64_t> published_{0};

  void deliver_to_sinks(const Notification &notification);
  void worker_loop();
};

} // namespace notify
} // namespace fairduel
