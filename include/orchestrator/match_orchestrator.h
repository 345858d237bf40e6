#pragma once

#include "common/config.h"
#include "common/types.h"
#include "fairness/fairness_engine.h"
#include "notify/notification.h"
#include "reliability/tracker.h"
#include "rewards/calculator.h"
#include "scheduling/timeout_coordinator.h"
#include "storage/duel_store.h"
#include <memory>
#include <optional>
#include <vector>

namespace fairduel {
namespace orchestrator {

using namespace fairduel::common;
using storage::GameRecord;
using storage::MatchRecord;

/**
 * Reply to a number submission
 */
struct SubmitResult {
  bool submitted = false;
  bool both_ready = false; ///< The round was resolved by this submission
  int64_t my_number = 0;
  uint32_t round_number = 0;
  GameRecord game; ///< Game state after the submission
};

/**
 * What one player may see of the current round. The opponent's number is
 * withheld until the round is finished.
 */
struct RoundStatus {
  GameId game_id;
  MatchId match_id;
  uint32_t round_number = 0;
  std::optional<int64_t> my_number;
  bool opponent_submitted = false;
  std::optional<int64_t> opponent_number;
  TimestampMs deadline = 0;
  storage::GameStatus status = storage::GameStatus::AWAITING_NUMBERS;
};

struct UserStats {
  UserId user_id;
  std::string username;
  uint32_t matches_played = 0;
  uint32_t wins = 0;
  uint32_t losses = 0;
  uint32_t draws = 0;
  Points net_points = 0; ///< Across settled orders only
  Points balance = 0;
  reliability::ReliabilityMetrics reliability;
};

/**
 * @brief Drives a match from confirmation to settlement
 *
 * Rounds are strictly sequential: a match only ever has one game in
 * AWAITING_NUMBERS. A round is resolved inside the transaction that
 * stores its second number, so the fairness engine runs exactly once per
 * round and the finished game, the match aggregate and any settlement are
 * committed together.
 *
 * Round deadlines start at started_at + round_ceiling and tighten to
 * min(ceiling, first_submission + submission_window).
 */
class MatchOrchestrator {
public:
  MatchOrchestrator(std::shared_ptr<storage::DuelStore> store,
                    EngineConfig config,
                    std::shared_ptr<const fairness::FairnessEngine> fairness,
                    std::shared_ptr<notify::NotificationDispatcher> notifier,
                    std::shared_ptr<scheduling::TimeoutCoordinator> timeouts);

  /// MATCHED -> IN_PROGRESS and round 1. Idempotent.
  Result<MatchRecord> start_match(const MatchId &match_id);

  Result<SubmitResult> submit_player_number(const GameId &game_id,
                                            const Caller &caller,
                                            int64_t number);

  /// STATE_CONFLICT unless round_number is the match's current round
  Result<SubmitResult> submit_for_round(const MatchId &match_id,
                                        const Caller &caller,
                                        uint32_t round_number, int64_t number);

  /**
   * @brief Round deadline handler
   *
   * No-op if the game is finished or its deadline has not passed; returns
   * the game as it stands afterwards.
   */
  Result<GameRecord> handle_round_timeout(const GameId &game_id);

  std::optional<GameRecord> get_game(const GameId &game_id) const;
  /// Ordered by round number
  std::vector<GameRecord> games_for_match(const MatchId &match_id) const;
  std::optional<MatchRecord> get_match(const MatchId &match_id) const;
  std::vector<MatchRecord> matches_for_user(const UserId &user_id) const;

  Result<RoundStatus> round_status(const MatchId &match_id,
                                   const Caller &caller) const;
  Result<UserStats> user_stats(const UserId &user_id) const;

private:
  std::shared_ptr<storage::DuelStore> store_;
  EngineConfig config_;
  std::shared_ptr<const fairness::FairnessEngine> fairness_;
  rewards::RewardCalculator calculator_;
  reliability::ReliabilityTracker tracker_;
  std::shared_ptr<notify::NotificationDispatcher> notifier_;
  std::shared_ptr<scheduling::TimeoutCoordinator> timeouts_;

  Result<GameRecord> open_round(storage::StoreTransaction &tx,
                                MatchRecord &match, uint32_t round_number);
  Result<bool> resolve_round(storage::StoreTransaction &tx, MatchRecord &match,
                             GameRecord &game);
  Result<bool> record_round(storage::StoreTransaction &tx, MatchRecord &match,
                            const GameRecord &game);
  Result<bool> settle(storage::StoreTransaction &tx, MatchRecord &match,
                      storage::MatchStatus status,
                      const rewards::RewardResult &reward);
  Result<bool> record_event(storage::StoreTransaction &tx,
                            const UserId &user_id,
                            reliability::ReliabilityEvent event);

  void schedule_round_deadline(storage::StoreTransaction &tx,
                               const GameRecord &game);
  void notify_players(storage::StoreTransaction &tx, const MatchRecord &match,
                      notify::NotificationType type,
                      const std::string &message, const GameRecord *game);
  void notify_user(storage::StoreTransaction &tx, const UserId &user_id,
                   notify::NotificationType type, const std::string &message,
                   const MatchRecord &match);
};

} // namespace orchestrator
} // namespace fairduel
