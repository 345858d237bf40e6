#pragma once

#include "common/types.h"
#include <atomic>
#include <chrono>

namespace fairduel {
namespace common {

/**
 * @brief Source of wall-clock time for deadlines and fairness time slots
 *
 * Every component reads time through this interface so that deadline
 * behaviour can be driven deterministically in tests.
 */
class Clock {
public:
  virtual ~Clock() = default;
  virtual TimestampMs now_ms() const = 0;
};

class SystemClock : public Clock {
public:
  TimestampMs now_ms() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

/// @brief Clock that only moves when told to
class ManualClock : public Clock {
public:
  explicit ManualClock(TimestampMs start_ms = 0) : now_(start_ms) {}

  TimestampMs now_ms() const override {
    return now_.load(std::memory_order_acquire);
  }

  void set(TimestampMs now) { now_.store(now, std::memory_order_release); }

  void advance(std::chrono::milliseconds delta) {
    now_.fetch_add(delta.count(), std::memory_order_acq_rel);
  }

private:
  std::atomic<TimestampMs> now_;
};

} // namespace common
} // namespace fairduel
