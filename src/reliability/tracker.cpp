#include "reliability/tracker.h"
#include <algorithm>
#include <cmath>

namespace fairduel {
namespace reliability {

const char *event_name(ReliabilityEvent event) noexcept {
  switch (event) {
  case ReliabilityEvent::MISSED_CONFIRMATION:
    return "MISSED_CONFIRMATION";
  case ReliabilityEvent::DUEL_COMPLETED:
    return "DUEL_COMPLETED";
  case ReliabilityEvent::DROPPED_BEFORE_MIN_GAMES:
    return "DROPPED_BEFORE_MIN_GAMES";
  }
  return "UNKNOWN";
}

const char *rank_name(ReliabilityRank rank) noexcept {
  switch (rank) {
  case ReliabilityRank::TRUSTED:
    return "TRUSTED";
  case ReliabilityRank::RELIABLE:
    return "RELIABLE";
  case ReliabilityRank::AVERAGE:
    return "AVERAGE";
  case ReliabilityRank::RISKY:
    return "RISKY";
  case ReliabilityRank::UNRELIABLE:
    return "UNRELIABLE";
  }
  return "UNKNOWN";
}

ReliabilityTracker::ReliabilityTracker(ReliabilityPolicy policy)
    : policy_(policy) {}

void ReliabilityTracker::apply_event(ReliabilityCounters &counters,
                                     ReliabilityEvent event) {
  counters.total_deals += 1;

  switch (event) {
  case ReliabilityEvent::MISSED_CONFIRMATION:
    counters.missed_confirmations += 1;
    break;
  case ReliabilityEvent::DUEL_COMPLETED:
    counters.completed_deals += 1;
    break;
  case ReliabilityEvent::DROPPED_BEFORE_MIN_GAMES:
    counters.dropped_before_min_games += 1;
    break;
  }
}

double ReliabilityTracker::coefficient(const ReliabilityCounters &counters) {
  if (counters.total_deals == 0) {
    return 1.0;
  }
  return static_cast<double>(counters.completed_deals) /
         static_cast<double>(counters.total_deals);
}

ReliabilityRank ReliabilityTracker::rank_for(double coefficient) {
  if (coefficient >= 0.9)
    return ReliabilityRank::TRUSTED;
  if (coefficient >= 0.7)
    return ReliabilityRank::RELIABLE;
  if (coefficient >= 0.5)
    return ReliabilityRank::AVERAGE;
  if (coefficient >= 0.3)
    return ReliabilityRank::RISKY;
  return ReliabilityRank::UNRELIABLE;
}

ReliabilityMetrics
ReliabilityTracker::metrics(const std::string &user_id,
                            const std::string &username,
                            const ReliabilityCounters &counters) const {
  ReliabilityMetrics m;
  m.user_id = user_id;
  m.username = username;
  m.counters = counters;
  m.coefficient = coefficient(counters);
  m.rank = rank_for(m.coefficient);
  return m;
}

bool ReliabilityTracker::can_trade(const ReliabilityMetrics &metrics) const {
  return metrics.coefficient >= policy_.min_coefficient_to_trade;
}

bool ReliabilityTracker::should_show_warning(const ReliabilityMetrics &metrics) {
  return metrics.rank == ReliabilityRank::RISKY ||
         metrics.rank == ReliabilityRank::UNRELIABLE;
}

std::string ReliabilityTracker::format(const ReliabilityMetrics &metrics) {
  static const char *display_names[] = {"Trusted", "Reliable", "Average",
                                        "Risky", "Unreliable"};
  long percentage = std::lround(metrics.coefficient * 100.0);
  return std::to_string(percentage) + "% (" +
         display_names[static_cast<int>(metrics.rank)] + ")";
}

std::vector<ReliabilityMetrics>
ReliabilityTracker::leaderboard(std::vector<ReliabilityMetrics> users,
                                size_t limit) {
  users.erase(std::remove_if(users.begin(), users.end(),
                             [](const ReliabilityMetrics &m) {
                               return m.counters.total_deals == 0;
                             }),
              users.end());

  std::stable_sort(users.begin(), users.end(),
                   [](const ReliabilityMetrics &a,
                      const ReliabilityMetrics &b) {
                     if (a.coefficient != b.coefficient)
                       return a.coefficient > b.coefficient;
                     return a.counters.total_deals > b.counters.total_deals;
                   });

  if (users.size() > limit) {
    users.resize(limit);
  }
  return users;
}

} // namespace reliability
} // namespace fairduel
