#include "notify/notification.h"
#include "common/logging.h"

namespace fairduel {
namespace notify {

const char *notification_type_name(NotificationType type) noexcept {
  switch (type) {
  case NotificationType::OPPONENT_FOUND:
    return "OPPONENT_FOUND";
  case NotificationType::CONFIRMATION_REQUIRED:
    return "CONFIRMATION_REQUIRED";
  case NotificationType::CONFIRMATION_EXPIRED:
    return "CONFIRMATION_EXPIRED";
  case NotificationType::ROUND_STARTED:
    return "ROUND_STARTED";
  case NotificationType::ROUND_RESULT:
    return "ROUND_RESULT";
  case NotificationType::OPPONENT_FORFEITED:
    return "OPPONENT_FORFEITED";
  case NotificationType::SERIES_COMPLETED:
    return "SERIES_COMPLETED";
  }
  return "UNKNOWN";
}

void LoggingNotificationSink::deliver(const Notification &notification) {
  auto context = notification.context;
  context["user_id"] = notification.user_id;
  context["type"] = notification_type_name(notification.type);
  LOG_STRUCTURED(LogLevel::INFO, "notify", notification.message, "", context);
}

NotificationDispatcher::NotificationDispatcher(bool async_delivery)
    : async_delivery_(async_delivery) {
  if (async_delivery_) {
    worker_ = std::thread(&NotificationDispatcher::worker_loop, this);
  }
}

NotificationDispatcher::~NotificationDispatcher() { shutdown(); }

void NotificationDispatcher::add_sink(std::shared_ptr<INotificationSink> sink) {
  if (!sink)
    return;
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  LOG_DEBUG("notify", "Registered notification sink ", sink->get_name());
  sinks_.push_back(std::move(sink));
}

void NotificationDispatcher::publish(Notification notification) {
  published_.fetch_add(1, std::memory_order_relaxed);

  if (!async_delivery_) {
    deliver_to_sinks(notification);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_) {
      LOG_WARN("notify", "Dropping ",
               notification_type_name(notification.type),
               " notification after shutdown");
      return;
    }
    queue_.push(std::move(notification));
  }
  queue_cv_.notify_one();
}

void NotificationDispatcher::flush() {
  if (!async_delivery_)
    return;
  std::unique_lock<std::mutex> lock(queue_mutex_);
  drained_cv_.wait(lock, [this] { return queue_.empty() && !in_flight_; });
}

void NotificationDispatcher::shutdown() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutdown_)
      return;
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void NotificationDispatcher::deliver_to_sinks(
    const Notification &notification) {
  std::vector<std::shared_ptr<INotificationSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks = sinks_;
  }

  for (const auto &sink : sinks) {
    try {
      sink->deliver(notification);
    } catch (const std::exception &e) {
      LOG_ERROR("notify", "Sink ", sink->get_name(), " failed to deliver ",
                notification_type_name(notification.type), ": ", e.what());
    }
  }
}

void NotificationDispatcher::worker_loop() {
  while (true) {
    Notification notification;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
      if (queue_.empty()) {
        // shutdown_ with nothing left to deliver
        drained_cv_.notify_all();
        return;
      }
      notification = std::move(queue_.front());
      queue_.pop();
      in_flight_ = true;
    }

    deliver_to_sinks(notification);

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      in_flight_ = false;
    }
    drained_cv_.notify_all();
  }
}

} // namespace notify
} // namespace fairduel
