#include "rewards/calculator.h"

namespace fairduel {
namespace rewards {

const char *settlement_kind_name(SettlementKind kind) noexcept {
  switch (kind) {
  case SettlementKind::LOCKED:
    return "LOCKED";
  case SettlementKind::DECISIVE:
    return "DECISIVE";
  case SettlementKind::DRAW:
    return "DRAW";
  case SettlementKind::FORFEIT:
    return "FORFEIT";
  case SettlementKind::ABANDONED:
    return "ABANDONED";
  }
  return "UNKNOWN";
}

RewardCalculator::RewardCalculator(uint32_t min_games_required)
    : min_games_required_(min_games_required) {}

RewardResult RewardCalculator::calculate_match_rewards(
    const SeriesScore &score, Points stake_per_game) const {
  RewardResult result;
  const Points player_stake =
      stake_per_game * static_cast<Points>(score.games_planned);

  if (!should_release_rewards(score.games_played)) {
    result.kind = SettlementKind::LOCKED;
    result.message = "Minimum " + std::to_string(min_games_required_) +
                     " games required. Played: " +
                     std::to_string(score.games_played);
    return result;
  }

  result.rewards_released = true;

  if (score.wins_a == score.wins_b) {
    result.kind = SettlementKind::DRAW;
    result.is_draw = true;
    result.credits.push_back({Side::A, player_stake, TransactionType::STAKE_REFUND});
    result.credits.push_back({Side::B, player_stake, TransactionType::STAKE_REFUND});
    result.message = "Match draw! Stakes returned.";
    return result;
  }

  Side winner = score.wins_a > score.wins_b ? Side::A : Side::B;
  result.kind = SettlementKind::DECISIVE;
  result.winner = winner;
  result.points_transferred = player_stake;
  result.credits.push_back({winner, player_stake, TransactionType::STAKE_RETURN});
  result.credits.push_back({winner, player_stake, TransactionType::DUEL_WIN});
  result.message = std::string("Player ") + side_name(winner) + " wins! +" +
                   std::to_string(player_stake) + " points";
  return result;
}

RewardResult RewardCalculator::calculate_forfeit(Side forfeiting_side,
                                                 uint32_t games_played,
                                                 uint32_t games_planned,
                                                 Points stake_per_game) const {
  RewardResult result;
  const Points player_stake =
      stake_per_game * static_cast<Points>(games_planned);
  const Side winner = other_side(forfeiting_side);

  result.kind = SettlementKind::FORFEIT;
  result.winner = winner;
  result.rewards_released = true;
  result.points_transferred = player_stake;
  result.credits.push_back({winner, 2 * player_stake, TransactionType::FORFEIT_WIN});
  result.message = std::string("Forfeit after ") + std::to_string(games_played) +
                   " game(s). Player " + side_name(winner) +
                   " wins both stakes.";
  return result;
}

RewardResult RewardCalculator::calculate_abandonment(
    uint32_t games_planned, Points stake_per_game) const {
  RewardResult result;
  const Points player_stake =
      stake_per_game * static_cast<Points>(games_planned);

  result.kind = SettlementKind::ABANDONED;
  result.rewards_released = true;
  result.credits.push_back({Side::A, player_stake, TransactionType::STAKE_REFUND});
  result.credits.push_back({Side::B, player_stake, TransactionType::STAKE_REFUND});
  result.message = "Both players missed the round. Stakes returned.";
  return result;
}

Points RewardCalculator::total_credits(const RewardResult &result) {
  Points total = 0;
  for (const auto &credit : result.credits) {
    total += credit.amount;
  }
  return total;
}

std::string RewardCalculator::format_reward_message(const RewardResult &result,
                                                    Side viewer) {
  if (!result.rewards_released) {
    return result.message;
  }

  if (result.kind == SettlementKind::DRAW ||
      result.kind == SettlementKind::ABANDONED) {
    return "Draw! Your stake has been returned.";
  }

  if (result.winner && *result.winner == viewer) {
    return "You won +" + std::to_string(result.points_transferred) +
           " points!";
  }
  return "You lost " + std::to_string(result.points_transferred) + " points.";
}

} // namespace rewards
} // namespace fairduel
