#include "scheduling/timeout_coordinator.h"
#include "common/logging.h"

namespace fairduel {
namespace scheduling {

const char *timeout_kind_name(TimeoutKind kind) noexcept {
  return kind == TimeoutKind::CONFIRMATION ? "CONFIRMATION" : "ROUND";
}

TimeoutCoordinator::TimeoutCoordinator(std::shared_ptr<Clock> clock,
                                       std::chrono::milliseconds sweep_interval)
    : clock_(std::move(clock)), sweep_interval_(sweep_interval) {
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }
}

TimeoutCoordinator::~TimeoutCoordinator() { stop(); }

void TimeoutCoordinator::register_handler(TimeoutKind kind, Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[static_cast<int>(kind)] = std::move(handler);
}

bool TimeoutCoordinator::schedule(TimeoutKind kind,
                                  const std::string &entity_id,
                                  TimestampMs deadline) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{static_cast<int>(kind), entity_id, deadline};
    if (!queued_keys_.insert(key).second) {
      return false;
    }
    queue_.push(Entry{deadline, kind, entity_id});
  }
  LOG_DEBUG("timeouts", "Scheduled ", timeout_kind_name(kind), " timeout for ",
            entity_id, " at ", deadline);
  wake_cv_.notify_one();
  return true;
}

size_t TimeoutCoordinator::run_due() {
  std::vector<std::pair<Entry, Handler>> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimestampMs now = clock_->now_ms();
    while (!queue_.empty() && queue_.top().deadline < now) {
      Entry entry = queue_.top();
      queue_.pop();
      queued_keys_.erase(
          Key{static_cast<int>(entry.kind), entry.entity_id, entry.deadline});

      auto it = handlers_.find(static_cast<int>(entry.kind));
      if (it == handlers_.end()) {
        LOG_WARN("timeouts", "No handler for ", timeout_kind_name(entry.kind),
                 " timeout of ", entry.entity_id);
        continue;
      }
      due.emplace_back(std::move(entry), it->second);
    }
  }

  // Handlers open store transactions; never call them with mutex_ held
  for (auto &item : due) {
    try {
      item.second(item.first.entity_id);
    } catch (const std::exception &e) {
      LOG_ERROR("timeouts", "Timeout handler failed for ",
                item.first.entity_id, ": ", e.what());
    }
  }
  return due.size();
}

bool TimeoutCoordinator::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true,
                                        std::memory_order_acq_rel)) {
    LOG_WARN("timeouts", "TimeoutCoordinator already running");
    return false;
  }
  worker_ = std::thread(&TimeoutCoordinator::worker_loop, this);
  LOG_INFO("timeouts", "TimeoutCoordinator started, sweep interval ",
           sweep_interval_.count(), "ms");
  return true;
}

void TimeoutCoordinator::stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false,
                                        std::memory_order_acq_rel)) {
    return;
  }
  wake_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  LOG_INFO("timeouts", "TimeoutCoordinator stopped");
}

size_t TimeoutCoordinator::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::optional<TimestampMs> TimeoutCoordinator::next_deadline() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.top().deadline;
}

void TimeoutCoordinator::worker_loop() {
  LOG_DEBUG("timeouts", "Timeout worker thread started");

  while (running_.load(std::memory_order_acquire)) {
    run_due();

    std::unique_lock<std::mutex> lock(mutex_);
    wake_cv_.wait_for(lock, sweep_interval_, [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }

  LOG_DEBUG("timeouts", "Timeout worker thread exiting");
}

} // namespace scheduling
} // namespace fairduel
