#pragma once

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>

namespace fairduel {
namespace rewards {

using namespace fairduel::common;

/**
 * Aggregate score of a series
 */
struct SeriesScore {
  uint32_t wins_a = 0;
  uint32_t wins_b = 0;
  uint32_t draws = 0;
  uint32_t games_played = 0;
  uint32_t games_planned = 0;
};

enum class SettlementKind {
  LOCKED,   ///< Minimum not reached; stakes stay in escrow
  DECISIVE, ///< One side has strictly more wins
  DRAW,     ///< Equal wins; both stakes refunded
  FORFEIT,  ///< Early forfeiture; both stakes to the opponent
  ABANDONED ///< Nobody showed up before the minimum; both stakes refunded
};

const char *settlement_kind_name(SettlementKind kind) noexcept;

/**
 * One ledger credit a settlement will post
 */
struct Credit {
  Side side;
  Points amount;
  TransactionType type;
};

struct RewardResult {
  SettlementKind kind = SettlementKind::LOCKED;
  std::optional<Side> winner;
  bool rewards_released = false;
  bool is_draw = false;
  Points points_transferred = 0; ///< Net gain of the winner
  std::vector<Credit> credits;
  std::string message;
};

/**
 * Stake transfer and refund rules
 *
 * Each player escrows stake_per_game * games_planned. A settlement always
 * disposes of both escrowed stakes: the credits of every released result
 * sum to 2 * stake_per_game * games_planned.
 */
class RewardCalculator {
public:
  explicit RewardCalculator(uint32_t min_games_required = MIN_GAMES_REQUIRED);

  RewardResult calculate_match_rewards(const SeriesScore &score,
                                       Points stake_per_game) const;

  /**
   * Forfeiture before the minimum number of rounds: the opponent of the
   * forfeiting side receives both locked stakes.
   */
  RewardResult calculate_forfeit(Side forfeiting_side, uint32_t games_played,
                                 uint32_t games_planned,
                                 Points stake_per_game) const;

  RewardResult calculate_abandonment(uint32_t games_planned,
                                     Points stake_per_game) const;

  bool should_release_rewards(uint32_t games_played) const {
    return games_played >= min_games_required_;
  }

  uint32_t min_games_required() const { return min_games_required_; }

  static Points total_credits(const RewardResult &result);

  static std::string format_reward_message(const RewardResult &result,
                                           Side viewer);

private:
  uint32_t min_games_required_;
};

} // namespace rewards
} // namespace fairduel
