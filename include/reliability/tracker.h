#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fairduel {
namespace reliability {

enum class ReliabilityEvent {
  MISSED_CONFIRMATION,
  DUEL_COMPLETED,
  DROPPED_BEFORE_MIN_GAMES
};

enum class ReliabilityRank { TRUSTED, RELIABLE, AVERAGE, RISKY, UNRELIABLE };

const char *event_name(ReliabilityEvent event) noexcept;
const char *rank_name(ReliabilityRank rank) noexcept;

/**
 * Per-user deal counters. Monotonic: events only ever increment them.
 */
struct ReliabilityCounters {
  uint64_t total_deals = 0;
  uint64_t completed_deals = 0;
  uint64_t missed_confirmations = 0;
  uint64_t dropped_before_min_games = 0;
};

struct ReliabilityMetrics {
  std::string user_id;
  std::string username;
  ReliabilityCounters counters;
  double coefficient = 1.0;
  ReliabilityRank rank = ReliabilityRank::TRUSTED;
};

/**
 * Admission rule applied when a user creates or joins an order
 */
struct ReliabilityPolicy {
  double min_coefficient_to_trade = 0.0;
};

/**
 * Trust coefficient bookkeeping
 *
 * coefficient = completed / total (1.0 for a user without deals).
 * Ranks: >=0.90 TRUSTED, >=0.70 RELIABLE, >=0.50 AVERAGE, >=0.30 RISKY,
 * otherwise UNRELIABLE.
 */
class ReliabilityTracker {
public:
  explicit ReliabilityTracker(ReliabilityPolicy policy = {});

  static void apply_event(ReliabilityCounters &counters,
                          ReliabilityEvent event);
  static double coefficient(const ReliabilityCounters &counters);
  static ReliabilityRank rank_for(double coefficient);

  ReliabilityMetrics metrics(const std::string &user_id,
                             const std::string &username,
                             const ReliabilityCounters &counters) const;

  bool can_trade(const ReliabilityMetrics &metrics) const;

  /// Opponents of RISKY and UNRELIABLE users are warned before joining
  static bool should_show_warning(const ReliabilityMetrics &metrics);

  /// e.g. "93% (Trusted)"
  static std::string format(const ReliabilityMetrics &metrics);

  /// Users with at least one deal, best coefficient first
  static std::vector<ReliabilityMetrics>
  leaderboard(std::vector<ReliabilityMetrics> users, size_t limit);

  const ReliabilityPolicy &policy() const { return policy_; }

private:
  ReliabilityPolicy policy_;
};

} // namespace reliability
} // namespace fairduel
