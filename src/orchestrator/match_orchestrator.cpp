#include "orchestrator/match_orchestrator.h"
#include "common/logging.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace fairduel {
namespace orchestrator {

using notify::NotificationType;
using reliability::ReliabilityEvent;
using storage::GameOutcome;
using storage::GameStatus;
using storage::MatchStatus;
using storage::OrderRecord;
using storage::OrderStatus;
using storage::StoreTransaction;

namespace {

rewards::SeriesScore score_of(const MatchRecord &match) {
  rewards::SeriesScore score;
  score.wins_a = match.wins_a;
  score.wins_b = match.wins_b;
  score.draws = match.draws;
  score.games_played = match.games_played;
  score.games_planned = match.games_planned;
  return score;
}

GameOutcome outcome_for(fairness::Winner winner) {
  switch (winner) {
  case fairness::Winner::PLAYER_A:
    return GameOutcome::A_WINS;
  case fairness::Winner::PLAYER_B:
    return GameOutcome::B_WINS;
  case fairness::Winner::DRAW:
    break;
  }
  return GameOutcome::DRAW;
}

} // namespace

MatchOrchestrator::MatchOrchestrator(
    std::shared_ptr<storage::DuelStore> store, EngineConfig config,
    std::shared_ptr<const fairness::FairnessEngine> fairness,
    std::shared_ptr<notify::NotificationDispatcher> notifier,
    std::shared_ptr<scheduling::TimeoutCoordinator> timeouts)
    : store_(std::move(store)), config_(std::move(config)),
      fairness_(std::move(fairness)),
      calculator_(config_.min_games_required),
      tracker_(reliability::ReliabilityPolicy{config_.min_reliability_to_trade}),
      notifier_(std::move(notifier)), timeouts_(std::move(timeouts)) {
  if (!fairness_) {
    throw std::invalid_argument("MatchOrchestrator requires a fairness engine");
  }
}

Result<MatchRecord> MatchOrchestrator::start_match(const MatchId &match_id) {
  auto result = store_->transact([&](StoreTransaction &tx) -> Result<MatchRecord> {
    auto current = tx.get_match(match_id);
    if (!current) {
      return Result<MatchRecord>(ErrorCode::NOT_FOUND,
                                 "Match not found: " + match_id);
    }
    MatchRecord match = current->value;
    if (match.current_game_id) {
      return Result<MatchRecord>(match);
    }

    auto order = tx.get_order(match.order_id);
    if (!order) {
      return Result<MatchRecord>(ErrorCode::INTERNAL,
                                 "Order missing for match " + match_id);
    }
    if (order->value.status != OrderStatus::MATCHED) {
      return Result<MatchRecord>(
          ErrorCode::STATE_CONFLICT,
          "Order is not MATCHED: " +
              std::string(storage::order_status_name(order->value.status)));
    }
    OrderRecord updated_order = order->value;
    updated_order.status = OrderStatus::IN_PROGRESS;
    updated_order.updated_at = tx.now();
    tx.put_order(updated_order, order->generation);

    auto game = open_round(tx, match, 1);
    if (game.is_err()) {
      return Result<MatchRecord>::from_error(game);
    }
    tx.put_match(match, current->generation);
    return Result<MatchRecord>(match);
  });

  if (result.is_ok()) {
    LOG_INFO("orchestrator", "Match ", match_id, " in progress, round ",
             result.value().current_round);
  }
  return result;
}

Result<SubmitResult>
MatchOrchestrator::submit_player_number(const GameId &game_id,
                                        const Caller &caller, int64_t number) {
  if (!fairness::is_valid_player_number(number)) {
    return Result<SubmitResult>(ErrorCode::VALIDATION,
                                "playerNumber must be an integer in [" +
                                    std::to_string(fairness::MIN_PLAYER_NUMBER) +
                                    ", " +
                                    std::to_string(fairness::MAX_PLAYER_NUMBER) +
                                    "]");
  }

  bool deadline_passed = false;
  auto result = store_->transact([&](StoreTransaction &tx) -> Result<SubmitResult> {
    auto current_game = tx.get_game(game_id);
    if (!current_game) {
      return Result<SubmitResult>(ErrorCode::NOT_FOUND,
                                  "Game not found: " + game_id);
    }
    GameRecord game = current_game->value;

    auto current_match = tx.get_match(game.match_id);
    if (!current_match) {
      return Result<SubmitResult>(ErrorCode::INTERNAL,
                                  "Match missing for game " + game_id);
    }
    MatchRecord match = current_match->value;

    if (!match.is_participant(caller.user_id)) {
      return Result<SubmitResult>(ErrorCode::NOT_PARTICIPANT,
                                  "Not a participant of this match");
    }
    const Side side = match.side_of(caller.user_id);
    if (game.number_of(side)) {
      return Result<SubmitResult>(ErrorCode::ALREADY_SUBMITTED,
                                  "Number already submitted for this round");
    }
    if (game.status == GameStatus::FINISHED ||
        match.status != MatchStatus::IN_PROGRESS) {
      return Result<SubmitResult>(ErrorCode::STATE_CONFLICT,
                                  "Round is already finished");
    }

    const TimestampMs now = tx.now();
    if (now > game.deadline) {
      deadline_passed = true;
      return Result<SubmitResult>(ErrorCode::EXPIRED,
                                  "Round deadline has passed");
    }

    if (side == Side::A) {
      game.player_a_number = number;
      game.player_a_submitted_at = now;
    } else {
      game.player_b_number = number;
      game.player_b_submitted_at = now;
    }

    SubmitResult reply;
    reply.submitted = true;
    reply.my_number = number;
    reply.round_number = game.round_number;

    if (!game.both_submitted()) {
      game.deadline = std::min(game.ceiling_deadline,
                               now + config_.submission_window.count());
      tx.put_game(game, current_game->generation);
      schedule_round_deadline(tx, game);
      reply.game = game;
      return Result<SubmitResult>(reply);
    }

    tx.put_game(game, current_game->generation);
    auto resolved = resolve_round(tx, match, game);
    if (resolved.is_err()) {
      return Result<SubmitResult>::from_error(resolved);
    }
    tx.put_match(match, current_match->generation);
    reply.both_ready = true;
    reply.game = game;
    return Result<SubmitResult>(reply);
  });

  if (deadline_passed) {
    auto timed_out = handle_round_timeout(game_id);
    if (timed_out.is_err()) {
      LOG_ERROR("orchestrator", "Timeout handling after late submission failed: ",
                timed_out.error());
    }
  }
  return result;
}

Result<SubmitResult> MatchOrchestrator::submit_for_round(const MatchId &match_id,
                                                         const Caller &caller,
                                                         uint32_t round_number,
                                                         int64_t number) {
  if (!fairness::is_valid_player_number(number)) {
    return Result<SubmitResult>(ErrorCode::VALIDATION,
                                "playerNumber out of range");
  }
  auto match = store_->get_match(match_id);
  if (!match) {
    return Result<SubmitResult>(ErrorCode::NOT_FOUND,
                                "Match not found: " + match_id);
  }
  if (!match->value.is_participant(caller.user_id)) {
    return Result<SubmitResult>(ErrorCode::NOT_PARTICIPANT,
                                "Not a participant of this match");
  }
  if (!match->value.current_game_id ||
      match->value.current_round != round_number) {
    return Result<SubmitResult>(
        ErrorCode::STATE_CONFLICT,
        "Round " + std::to_string(round_number) +
            " is not the current round (" +
            std::to_string(match->value.current_round) + ")");
  }
  // The game id is re-validated inside the submission transaction
  return submit_player_number(*match->value.current_game_id, caller, number);
}

Result<GameRecord> MatchOrchestrator::handle_round_timeout(const GameId &game_id) {
  return store_->transact([&](StoreTransaction &tx) -> Result<GameRecord> {
    auto current_game = tx.get_game(game_id);
    if (!current_game) {
      return Result<GameRecord>(ErrorCode::NOT_FOUND,
                                "Game not found: " + game_id);
    }
    GameRecord game = current_game->value;
    const TimestampMs now = tx.now();
    if (game.status == GameStatus::FINISHED || now <= game.deadline) {
      return Result<GameRecord>(game);
    }

    auto current_match = tx.get_match(game.match_id);
    if (!current_match) {
      return Result<GameRecord>(ErrorCode::INTERNAL,
                                "Match missing for game " + game_id);
    }
    MatchRecord match = current_match->value;
    if (match.status != MatchStatus::IN_PROGRESS) {
      return Result<GameRecord>(game);
    }

    const bool has_a = game.player_a_number.has_value();
    const bool has_b = game.player_b_number.has_value();
    const bool minimum_reached =
        calculator_.should_release_rewards(match.games_played);

    game.status = GameStatus::FINISHED;
    game.finished_at = now;

    if (!has_a && !has_b) {
      game.outcome = GameOutcome::ABANDONED;
      tx.put_game(game, current_game->generation);

      Result<bool> settled(true);
      if (!minimum_reached) {
        LOG_WARN("orchestrator", "Both players abandoned match ", match.id,
                 " after ", match.games_played, " game(s)");
        settled = settle(tx, match, MatchStatus::BOTH_ABANDONED,
                         calculator_.calculate_abandonment(
                             match.games_planned, match.stake_per_game));
        for (Side side : {Side::A, Side::B}) {
          if (settled.is_ok()) {
            settled = record_event(tx, match.player_id(side),
                                   ReliabilityEvent::DROPPED_BEFORE_MIN_GAMES);
          }
        }
      } else {
        LOG_INFO("orchestrator", "No submissions in round ", game.round_number,
                 " of match ", match.id, ", settling on rounds played");
        settled = settle(tx, match, MatchStatus::COMPLETED,
                         calculator_.calculate_match_rewards(
                             score_of(match), match.stake_per_game));
        for (Side side : {Side::A, Side::B}) {
          if (settled.is_ok()) {
            settled = record_event(tx, match.player_id(side),
                                   ReliabilityEvent::DUEL_COMPLETED);
          }
        }
      }
      if (settled.is_err()) {
        return Result<GameRecord>::from_error(settled);
      }
      tx.put_match(match, current_match->generation);
      return Result<GameRecord>(game);
    }

    const Side forfeiting = has_a ? Side::B : Side::A;
    const Side opponent = other_side(forfeiting);
    game.outcome = forfeiting == Side::A ? GameOutcome::FORFEITED_A
                                         : GameOutcome::FORFEITED_B;
    game.winner_id = match.player_id(opponent);

    if (!minimum_reached) {
      tx.put_game(game, current_game->generation);
      LOG_WARN("orchestrator", "Player ", match.player_id(forfeiting),
               " forfeited match ", match.id, " after ", match.games_played,
               " game(s)");

      auto settled = settle(
          tx, match, MatchStatus::FORFEITED,
          calculator_.calculate_forfeit(forfeiting, match.games_played,
                                        match.games_planned,
                                        match.stake_per_game));
      if (settled.is_ok()) {
        settled = record_event(tx, match.player_id(forfeiting),
                               ReliabilityEvent::DROPPED_BEFORE_MIN_GAMES);
      }
      if (settled.is_ok()) {
        settled = record_event(tx, match.player_id(opponent),
                               ReliabilityEvent::DUEL_COMPLETED);
      }
      if (settled.is_err()) {
        return Result<GameRecord>::from_error(settled);
      }
      notify_user(tx, match.player_id(opponent),
                  NotificationType::OPPONENT_FORFEITED,
                  "Your opponent forfeited. Both stakes are yours.", match);
      tx.put_match(match, current_match->generation);
      return Result<GameRecord>(game);
    }

    // Past the minimum a missed round only costs that round
    tx.put_game(game, current_game->generation);
    notify_user(tx, match.player_id(opponent),
                NotificationType::OPPONENT_FORFEITED,
                "Your opponent missed round " +
                    std::to_string(game.round_number) + ". You take it.",
                match);
    auto recorded = record_round(tx, match, game);
    if (recorded.is_err()) {
      return Result<GameRecord>::from_error(recorded);
    }
    tx.put_match(match, current_match->generation);
    return Result<GameRecord>(game);
  });
}

Result<GameRecord> MatchOrchestrator::open_round(StoreTransaction &tx,
                                                 MatchRecord &match,
                                                 uint32_t round_number) {
  const TimestampMs now = tx.now();

  GameRecord game;
  game.id = tx.next_id("game");
  game.match_id = match.id;
  game.round_number = round_number;
  game.started_at = now;
  game.ceiling_deadline = now + config_.round_ceiling.count();
  game.deadline = game.ceiling_deadline;

  auto inserted = tx.insert_game(game);
  if (inserted.is_err()) {
    return Result<GameRecord>::from_error(inserted);
  }

  match.current_game_id = game.id;
  match.current_round = round_number;

  schedule_round_deadline(tx, game);
  notify_players(tx, match, NotificationType::ROUND_STARTED,
                 "Round " + std::to_string(round_number) + " of " +
                     std::to_string(match.games_planned) +
                     " started. Submit your number.",
                 &game);
  return Result<GameRecord>(game);
}

Result<bool> MatchOrchestrator::resolve_round(StoreTransaction &tx,
                                              MatchRecord &match,
                                              GameRecord &game) {
  fairness::RoundParams params;
  params.duel_id = match.id;
  params.round_number = game.round_number;
  params.time_slot = fairness::calculate_time_slot(tx.now());
  params.player_a = {match.player_a_id, *game.player_a_number};
  params.player_b = {match.player_b_id, *game.player_b_number};

  auto determined = fairness_->determine_winner(params);
  if (determined.is_err()) {
    return Result<bool>::from_error(determined);
  }
  const fairness::RoundOutcome &outcome = determined.value();

  game.time_slot = params.time_slot;
  game.seed_slice = outcome.seed_slice;
  game.random_number = outcome.random_number;
  game.distance_a = outcome.distance_a;
  game.distance_b = outcome.distance_b;
  game.outcome = outcome_for(outcome.winner);
  game.winner_id = outcome.winner_id;
  game.status = GameStatus::FINISHED;
  game.finished_at = tx.now();
  tx.put_game(game);

  LOG_STRUCTURED(LogLevel::INFO, "orchestrator", "Round resolved", "",
                 {{"match_id", match.id},
                  {"round", std::to_string(game.round_number)},
                  {"seed_slice", game.seed_slice},
                  {"random_number", std::to_string(game.random_number)},
                  {"outcome", storage::game_outcome_name(game.outcome)}});

  return record_round(tx, match, game);
}

Result<bool> MatchOrchestrator::record_round(StoreTransaction &tx,
                                             MatchRecord &match,
                                             const GameRecord &game) {
  match.games_played += 1;
  switch (game.outcome) {
  case GameOutcome::A_WINS:
  case GameOutcome::FORFEITED_B:
    match.wins_a += 1;
    break;
  case GameOutcome::B_WINS:
  case GameOutcome::FORFEITED_A:
    match.wins_b += 1;
    break;
  case GameOutcome::DRAW:
    match.draws += 1;
    break;
  case GameOutcome::PENDING:
  case GameOutcome::ABANDONED:
    return Result<bool>(ErrorCode::INTERNAL,
                        "Cannot record a round without a result");
  }

  notify_players(tx, match, NotificationType::ROUND_RESULT,
                 "Round " + std::to_string(game.round_number) + ": " +
                     storage::game_outcome_name(game.outcome),
                 &game);

  if (match.games_played < match.games_planned) {
    auto next = open_round(tx, match, game.round_number + 1);
    if (next.is_err()) {
      return Result<bool>::from_error(next);
    }
    return Result<bool>(true);
  }

  auto reward = calculator_.calculate_match_rewards(score_of(match),
                                                    match.stake_per_game);
  if (!reward.rewards_released) {
    return Result<bool>(ErrorCode::INTERNAL,
                        "Series finished below the minimum: " + reward.message);
  }
  auto settled = settle(tx, match, MatchStatus::COMPLETED, reward);
  for (Side side : {Side::A, Side::B}) {
    if (settled.is_ok()) {
      settled = record_event(tx, match.player_id(side),
                             ReliabilityEvent::DUEL_COMPLETED);
    }
  }
  return settled;
}

Result<bool> MatchOrchestrator::settle(StoreTransaction &tx, MatchRecord &match,
                                       MatchStatus status,
                                       const rewards::RewardResult &reward) {
  auto order = tx.get_order(match.order_id);
  if (!order) {
    return Result<bool>(ErrorCode::INTERNAL,
                        "Order missing for match " + match.id);
  }

  for (const auto &credit : reward.credits) {
    auto applied = tx.apply_balance_change(
        match.player_id(credit.side), credit.amount, credit.type,
        match.order_id, match.id,
        std::string(transaction_type_name(credit.type)) + ": " +
            reward.message);
    if (applied.is_err()) {
      return Result<bool>::from_error(applied);
    }
  }

  const TimestampMs now = tx.now();
  match.status = status;
  match.finished_at = now;
  if (reward.winner) {
    match.winner_id = match.player_id(*reward.winner);
  } else {
    match.winner_id.reset();
  }

  OrderRecord updated_order = order->value;
  updated_order.status = status == MatchStatus::BOTH_ABANDONED
                             ? OrderStatus::CANCELLED
                             : OrderStatus::COMPLETED;
  updated_order.updated_at = now;
  tx.put_order(updated_order, order->generation);

  LOG_INFO("orchestrator", "Match ", match.id, " settled as ",
           storage::match_status_name(status), " (",
           rewards::settlement_kind_name(reward.kind), "): ", reward.message);

  for (Side side : {Side::A, Side::B}) {
    notify_user(tx, match.player_id(side), NotificationType::SERIES_COMPLETED,
                rewards::RewardCalculator::format_reward_message(reward, side),
                match);
  }
  return Result<bool>(true);
}

Result<bool> MatchOrchestrator::record_event(StoreTransaction &tx,
                                             const UserId &user_id,
                                             ReliabilityEvent event) {
  auto user = tx.get_user(user_id);
  if (!user) {
    return Result<bool>(ErrorCode::INTERNAL, "User missing: " + user_id);
  }
  storage::UserRecord updated = user->value;
  reliability::ReliabilityTracker::apply_event(updated.reliability, event);
  tx.put_user(updated);
  LOG_DEBUG("orchestrator", "Reliability event ",
            reliability::event_name(event), " for ", user_id);
  return Result<bool>(true);
}

void MatchOrchestrator::schedule_round_deadline(StoreTransaction &tx,
                                                const GameRecord &game) {
  if (!timeouts_)
    return;
  const GameId id = game.id;
  const TimestampMs deadline = game.deadline;
  tx.on_commit([this, id, deadline]() {
    timeouts_->schedule(scheduling::TimeoutKind::ROUND, id, deadline);
  });
}

void MatchOrchestrator::notify_players(StoreTransaction &tx,
                                       const MatchRecord &match,
                                       NotificationType type,
                                       const std::string &message,
                                       const GameRecord *game) {
  if (!notifier_)
    return;
  for (Side side : {Side::A, Side::B}) {
    notify::Notification notification;
    notification.type = type;
    notification.user_id = match.player_id(side);
    notification.message = message;
    notification.context["match_id"] = match.id;
    if (game) {
      notification.context["game_id"] = game->id;
      notification.context["round"] = std::to_string(game->round_number);
      notification.context["deadline"] = std::to_string(game->deadline);
      if (game->status == GameStatus::FINISHED && !game->seed_slice.empty()) {
        notification.context["seed_slice"] = game->seed_slice;
      }
    }
    notification.created_at = tx.now();
    tx.on_commit([this, notification]() { notifier_->publish(notification); });
  }
}

void MatchOrchestrator::notify_user(StoreTransaction &tx, const UserId &user_id,
                                    NotificationType type,
                                    const std::string &message,
                                    const MatchRecord &match) {
  if (!notifier_)
    return;
  notify::Notification notification;
  notification.type = type;
  notification.user_id = user_id;
  notification.message = message;
  notification.context["match_id"] = match.id;
  notification.created_at = tx.now();
  tx.on_commit([this, notification]() { notifier_->publish(notification); });
}

std::optional<GameRecord>
MatchOrchestrator::get_game(const GameId &game_id) const {
  auto game = store_->get_game(game_id);
  if (!game) {
    return std::nullopt;
  }
  return game->value;
}

std::vector<GameRecord>
MatchOrchestrator::games_for_match(const MatchId &match_id) const {
  auto games = store_->select_games(
      [&](const GameRecord &game) { return game.match_id == match_id; });
  std::sort(games.begin(), games.end(),
            [](const GameRecord &a, const GameRecord &b) {
              return a.round_number < b.round_number;
            });
  return games;
}

std::optional<MatchRecord>
MatchOrchestrator::get_match(const MatchId &match_id) const {
  auto match = store_->get_match(match_id);
  if (!match) {
    return std::nullopt;
  }
  return match->value;
}

std::vector<MatchRecord>
MatchOrchestrator::matches_for_user(const UserId &user_id) const {
  auto matches = store_->select_matches(
      [&](const MatchRecord &match) { return match.is_participant(user_id); });
  std::reverse(matches.begin(), matches.end());
  std::stable_sort(matches.begin(), matches.end(),
                   [](const MatchRecord &a, const MatchRecord &b) {
                     return a.created_at > b.created_at;
                   });
  return matches;
}

Result<RoundStatus> MatchOrchestrator::round_status(const MatchId &match_id,
                                                    const Caller &caller) const {
  auto match = store_->get_match(match_id);
  if (!match) {
    return Result<RoundStatus>(ErrorCode::NOT_FOUND,
                               "Match not found: " + match_id);
  }
  if (!match->value.is_participant(caller.user_id)) {
    return Result<RoundStatus>(ErrorCode::NOT_PARTICIPANT,
                               "Not a participant of this match");
  }
  if (!match->value.current_game_id) {
    return Result<RoundStatus>(ErrorCode::STATE_CONFLICT,
                               "Match has not started yet");
  }
  auto game = store_->get_game(*match->value.current_game_id);
  if (!game) {
    return Result<RoundStatus>(ErrorCode::INTERNAL, "Current game missing");
  }

  const Side side = match->value.side_of(caller.user_id);
  const GameRecord &g = game->value;

  RoundStatus status;
  status.game_id = g.id;
  status.match_id = g.match_id;
  status.round_number = g.round_number;
  status.my_number = g.number_of(side);
  status.opponent_submitted = g.number_of(other_side(side)).has_value();
  if (g.status == GameStatus::FINISHED) {
    status.opponent_number = g.number_of(other_side(side));
  }
  status.deadline = g.deadline;
  status.status = g.status;
  return Result<RoundStatus>(status);
}

Result<UserStats> MatchOrchestrator::user_stats(const UserId &user_id) const {
  auto user = store_->get_user(user_id);
  if (!user) {
    return Result<UserStats>(ErrorCode::NOT_FOUND, "User not found: " + user_id);
  }

  UserStats stats;
  stats.user_id = user_id;
  stats.username = user->value.username;
  stats.balance = user->value.points_balance;
  stats.reliability = tracker_.metrics(user_id, user->value.username,
                                       user->value.reliability);

  for (const auto &match : matches_for_user(user_id)) {
    if (match.status == MatchStatus::IN_PROGRESS) {
      continue;
    }
    stats.matches_played += 1;
    if (match.winner_id) {
      if (*match.winner_id == user_id) {
        stats.wins += 1;
      } else {
        stats.losses += 1;
      }
    } else if (match.status == MatchStatus::COMPLETED) {
      stats.draws += 1;
    }
  }

  std::unordered_set<OrderId> settled_orders;
  for (const auto &order : store_->select_orders([](const OrderRecord &o) {
         return storage::is_terminal(o.status);
       })) {
    settled_orders.insert(order.id);
  }
  for (const auto &entry : store_->select_ledger(
           [&](const storage::LedgerEntry &e) { return e.user_id == user_id; })) {
    if (entry.related_order_id && settled_orders.count(*entry.related_order_id)) {
      stats.net_points += entry.amount;
    }
  }
  return Result<UserStats>(stats);
}

} // namespace orchestrator
} // namespace fairduel
