#pragma once

#include "common/chips.h"
#include "common/types.h"
#include "reliability/tracker.h"
#include <optional>
#include <string>

namespace fairduel {
namespace storage {

using namespace fairduel::common;

/**
 * Order lifecycle
 *
 * OPEN -> WAITING_CREATOR_CONFIRM -> MATCHED -> IN_PROGRESS -> COMPLETED
 * OPEN -> CANCELLED, WAITING_CREATOR_CONFIRM -> OPEN | EXPIRED,
 * IN_PROGRESS -> CANCELLED (both players abandoned the series)
 */
enum class OrderStatus {
  OPEN,
  WAITING_CREATOR_CONFIRM,
  MATCHED,
  IN_PROGRESS,
  COMPLETED,
  CANCELLED,
  EXPIRED
};

enum class MatchStatus { IN_PROGRESS, COMPLETED, FORFEITED, BOTH_ABANDONED };

enum class GameStatus { AWAITING_NUMBERS, FINISHED };

enum class GameOutcome {
  PENDING,
  A_WINS,
  B_WINS,
  DRAW,
  FORFEITED_A, ///< A missed the deadline; B takes the round
  FORFEITED_B,
  ABANDONED ///< Neither player submitted
};

const char *order_status_name(OrderStatus status) noexcept;
const char *match_status_name(MatchStatus status) noexcept;
const char *game_status_name(GameStatus status) noexcept;
const char *game_outcome_name(GameOutcome outcome) noexcept;

inline bool is_terminal(OrderStatus status) noexcept {
  return status == OrderStatus::COMPLETED ||
         status == OrderStatus::CANCELLED || status == OrderStatus::EXPIRED;
}

struct UserRecord {
  UserId id;
  std::string username;
  Points points_balance = 0;
  reliability::ReliabilityCounters reliability;
  TimestampMs created_at = 0;
};

struct OrderRecord {
  OrderId id;
  UserId owner_id;
  ChipType chip_type = ChipType::SMILE;
  Points stake_per_game = 0;
  uint32_t games_planned = 0;
  OrderStatus status = OrderStatus::OPEN;
  std::optional<UserId> opponent_id;
  std::optional<TimestampMs> confirmation_deadline;
  std::optional<MatchId> match_id;
  uint32_t missed_confirmations = 0;
  TimestampMs created_at = 0;
  TimestampMs updated_at = 0;

  /// Points escrowed by each participant
  Points total_stake() const {
    return stake_per_game * static_cast<Points>(games_planned);
  }
};

struct MatchRecord {
  MatchId id;
  OrderId order_id;
  UserId player_a_id; ///< order owner
  UserId player_b_id; ///< joiner
  Points stake_per_game = 0;
  uint32_t games_planned = 0;
  uint32_t games_played = 0;
  uint32_t wins_a = 0;
  uint32_t wins_b = 0;
  uint32_t draws = 0;
  MatchStatus status = MatchStatus::IN_PROGRESS;
  std::optional<UserId> winner_id;
  std::optional<GameId> current_game_id;
  uint32_t current_round = 0;
  TimestampMs created_at = 0;
  std::optional<TimestampMs> finished_at;

  bool is_participant(const UserId &user_id) const {
    return user_id == player_a_id || user_id == player_b_id;
  }

  /// @warning Only meaningful for participants
  Side side_of(const UserId &user_id) const {
    return user_id == player_a_id ? Side::A : Side::B;
  }

  const UserId &player_id(Side side) const {
    return side == Side::A ? player_a_id : player_b_id;
  }
};

/**
 * Typed round state. Immutable once status is FINISHED.
 */
struct GameRecord {
  GameId id;
  MatchId match_id;
  uint32_t round_number = 0; ///< 1-based index within the match
  TimestampMs started_at = 0;
  TimestampMs deadline = 0;
  TimestampMs ceiling_deadline = 0;
  std::optional<int64_t> player_a_number;
  std::optional<int64_t> player_b_number;
  std::optional<TimestampMs> player_a_submitted_at;
  std::optional<TimestampMs> player_b_submitted_at;
  GameStatus status = GameStatus::AWAITING_NUMBERS;
  GameOutcome outcome = GameOutcome::PENDING;
  std::optional<UserId> winner_id;

  // Fairness proof, filled on resolution
  int64_t time_slot = 0;
  std::string seed_slice;
  uint32_t random_number = 0;
  int64_t distance_a = 0;
  int64_t distance_b = 0;
  std::optional<TimestampMs> finished_at;

  bool both_submitted() const {
    return player_a_number.has_value() && player_b_number.has_value();
  }

  const std::optional<int64_t> &number_of(Side side) const {
    return side == Side::A ? player_a_number : player_b_number;
  }
};

/**
 * Append-only ledger entry. amount is negative for debits.
 */
struct LedgerEntry {
  std::string id;
  UserId user_id;
  TransactionType type = TransactionType::INITIAL_BALANCE;
  Points amount = 0;
  std::optional<OrderId> related_order_id;
  std::optional<MatchId> related_match_id;
  std::string description;
  TimestampMs created_at = 0;
};

/**
 * A record together with the generation of the slot it was read from
 */
template <typename T> struct Versioned {
  T value;
  uint64_t generation = 0;
};

} // namespace storage
} // namespace fairduel
