#pragma once

#include "common/clock.h"
#include "common/types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fairduel {
namespace scheduling {

using namespace fairduel::common;

enum class TimeoutKind { CONFIRMATION, ROUND };

const char *timeout_kind_name(TimeoutKind kind) noexcept;

struct ScheduledTimeout {
  TimeoutKind kind;
  std::string entity_id;
  TimestampMs deadline;
};

/**
 * Deadline sweeper for order confirmations and round submissions
 *
 * Deadlines are read from the injected Clock, so tests drive the
 * coordinator by advancing a ManualClock and calling run_due(). In
 * production start() runs a worker that sweeps every sweep_interval.
 *
 * Handlers must be idempotent: they re-read state inside a store
 * transaction and do nothing if the entity has already moved on. A
 * (kind, id, deadline) triple is only queued once.
 *
 * Thread-Safety: All public methods are thread-safe
 */
class TimeoutCoordinator {
public:
  using Handler = std::function<void(const std::string &entity_id)>;

  TimeoutCoordinator(std::shared_ptr<Clock> clock,
                     std::chrono::milliseconds sweep_interval);
  ~TimeoutCoordinator();

  TimeoutCoordinator(const TimeoutCoordinator &) = delete;
  TimeoutCoordinator &operator=(const TimeoutCoordinator &) = delete;

  void register_handler(TimeoutKind kind, Handler handler);

  /// @return false if the same deadline was already queued
  bool schedule(TimeoutKind kind, const std::string &entity_id,
                TimestampMs deadline);

  /**
   * @brief Fire every handler whose deadline has passed
   *
   * A deadline equal to now is still open, matching the handlers' own
   * now > deadline check.
   * @return number of handlers invoked
   */
  size_t run_due();

  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  size_t pending() const;
  std::optional<TimestampMs> next_deadline() const;

private:
  struct Entry {
    TimestampMs deadline;
    TimeoutKind kind;
    std::string entity_id;

    bool operator>(const Entry &other) const {
      return deadline > other.deadline;
    }
  };

  using Key = std::tuple<int, std::string, TimestampMs>;

  std::shared_ptr<Clock> clock_;
  std::chrono::milliseconds sweep_interval_;

  mutable std::mutex mutex_;
  std::condition_variable wake_cv_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue_;
  std::set<Key> queued_keys_;
  std::unordered_map<int, Handler> handlers_;

  std::atomic<bool> running_{false};
  std::thread worker_;

  void worker_loop();
};

} // namespace scheduling
} // namespace fairduel
