#include "engine/dto.h"
#include "common/chips.h"
#include <limits>

namespace fairduel {
namespace engine {

namespace {

template <typename T> json optional_json(const std::optional<T> &value) {
  return value ? json(*value) : json(nullptr);
}

// Accepts only JSON integers; 12.5 or "12" are rejected
Result<int64_t> read_integer(const json &body, const char *key) {
  if (!body.contains(key)) {
    return Result<int64_t>(ErrorCode::VALIDATION,
                           std::string("Missing field: ") + key);
  }
  const auto &value = body.at(key);
  if (!value.is_number_integer()) {
    return Result<int64_t>(ErrorCode::VALIDATION,
                           std::string(key) + " must be an integer");
  }
  return Result<int64_t>(value.get<int64_t>());
}

Result<std::string> read_string(const json &body, const char *key) {
  if (!body.contains(key) || !body.at(key).is_string()) {
    return Result<std::string>(ErrorCode::VALIDATION,
                               std::string("Missing string field: ") + key);
  }
  return Result<std::string>(body.at(key).get<std::string>(), success_tag{});
}

} // namespace

Result<CreateOrderRequest> parse_create_order_request(const json &body) {
  if (!body.is_object()) {
    return Result<CreateOrderRequest>(ErrorCode::VALIDATION,
                                      "Request body must be an object");
  }
  auto chip = read_string(body, "chipType");
  if (chip.is_err()) {
    return Result<CreateOrderRequest>::from_error(chip);
  }
  auto chip_type = parse_chip_type(chip.value());
  if (!chip_type) {
    return Result<CreateOrderRequest>(ErrorCode::VALIDATION,
                                      "Unknown chip type: " + chip.value());
  }
  auto games = read_integer(body, "gamesPlanned");
  if (games.is_err()) {
    return Result<CreateOrderRequest>::from_error(games);
  }
  if (games.value() < 0 || games.value() > 1000) {
    return Result<CreateOrderRequest>(ErrorCode::VALIDATION,
                                      "gamesPlanned out of range");
  }

  CreateOrderRequest request;
  request.chip_type = *chip_type;
  request.games_planned = static_cast<uint32_t>(games.value());
  return Result<CreateOrderRequest>(request);
}

Result<SubmitRequest> parse_submit_request(const json &body) {
  if (!body.is_object()) {
    return Result<SubmitRequest>(ErrorCode::VALIDATION,
                                 "Request body must be an object");
  }
  auto round = read_integer(body, "roundNumber");
  if (round.is_err()) {
    return Result<SubmitRequest>::from_error(round);
  }
  if (round.value() < 1 ||
      round.value() > std::numeric_limits<uint32_t>::max()) {
    return Result<SubmitRequest>(ErrorCode::VALIDATION,
                                 "roundNumber out of range");
  }
  auto number = read_integer(body, "playerNumber");
  if (number.is_err()) {
    return Result<SubmitRequest>::from_error(number);
  }
  if (!fairness::is_valid_player_number(number.value())) {
    return Result<SubmitRequest>(ErrorCode::VALIDATION,
                                 "Invalid number (0-999999)");
  }

  SubmitRequest request;
  request.round_number = static_cast<uint32_t>(round.value());
  request.player_number = number.value();
  return Result<SubmitRequest>(request);
}

Result<VerifyRequest> parse_verify_request(const json &body) {
  if (!body.is_object()) {
    return Result<VerifyRequest>(ErrorCode::VALIDATION,
                                 "Request body must be an object");
  }
  auto seed_slice = read_string(body, "seedSlice");
  if (seed_slice.is_err()) {
    return Result<VerifyRequest>::from_error(seed_slice);
  }
  auto a = read_integer(body, "playerANumber");
  if (a.is_err()) {
    return Result<VerifyRequest>::from_error(a);
  }
  auto b = read_integer(body, "playerBNumber");
  if (b.is_err()) {
    return Result<VerifyRequest>::from_error(b);
  }

  VerifyRequest request;
  request.seed_slice = seed_slice.value();
  request.player_a_number = a.value();
  request.player_b_number = b.value();

  if (body.contains("claimedWinner")) {
    const auto &claimed = body.at("claimedWinner");
    std::optional<fairness::Winner> winner;
    if (claimed.is_string()) {
      winner = fairness::parse_winner(claimed.get<std::string>());
    } else if (claimed.is_number_integer()) {
      winner = fairness::parse_winner(std::to_string(claimed.get<int64_t>()));
    }
    if (!winner) {
      return Result<VerifyRequest>(ErrorCode::VALIDATION,
                                   "claimedWinner must be A, B or DRAW");
    }
    request.claimed_winner = *winner;
  }
  return Result<VerifyRequest>(request);
}

json to_json(const storage::UserRecord &user) {
  return json{{"id", user.id},
              {"username", user.username},
              {"pointsBalance", user.points_balance},
              {"totalDeals", user.reliability.total_deals},
              {"completedDeals", user.reliability.completed_deals},
              {"missedConfirmations", user.reliability.missed_confirmations},
              {"droppedBeforeMinGames",
               user.reliability.dropped_before_min_games},
              {"reliabilityCoefficient",
               reliability::ReliabilityTracker::coefficient(user.reliability)},
              {"createdAt", user.created_at}};
}

json to_json(const storage::OrderRecord &order) {
  return json{{"id", order.id},
              {"ownerId", order.owner_id},
              {"chipType", chip_name(order.chip_type)},
              {"stakePerGame", order.stake_per_game},
              {"gamesPlanned", order.games_planned},
              {"totalStake", order.total_stake()},
              {"status", storage::order_status_name(order.status)},
              {"opponentId", optional_json(order.opponent_id)},
              {"confirmationDeadline", optional_json(order.confirmation_deadline)},
              {"matchId", optional_json(order.match_id)},
              {"missedConfirmations", order.missed_confirmations},
              {"createdAt", order.created_at}};
}

json to_json(const storage::MatchRecord &match) {
  return json{{"id", match.id},
              {"orderId", match.order_id},
              {"playerAId", match.player_a_id},
              {"playerBId", match.player_b_id},
              {"stakePerGame", match.stake_per_game},
              {"gamesPlanned", match.games_planned},
              {"gamesPlayed", match.games_played},
              {"winsA", match.wins_a},
              {"winsB", match.wins_b},
              {"draws", match.draws},
              {"status", storage::match_status_name(match.status)},
              {"winnerId", optional_json(match.winner_id)},
              {"currentGameId", optional_json(match.current_game_id)},
              {"currentRound", match.current_round},
              {"createdAt", match.created_at},
              {"finishedAt", optional_json(match.finished_at)}};
}

json to_json(const storage::GameRecord &game) {
  json j{{"id", game.id},
         {"matchId", game.match_id},
         {"roundNumber", game.round_number},
         {"startedAt", game.started_at},
         {"deadline", game.deadline},
         {"ceilingDeadline", game.ceiling_deadline},
         {"status", storage::game_status_name(game.status)},
         {"outcome", storage::game_outcome_name(game.outcome)},
         {"winnerId", optional_json(game.winner_id)}};

  // Numbers stay private until the round is over
  if (game.status == storage::GameStatus::FINISHED) {
    j["playerANumber"] = optional_json(game.player_a_number);
    j["playerBNumber"] = optional_json(game.player_b_number);
    j["finishedAt"] = optional_json(game.finished_at);
    if (!game.seed_slice.empty()) {
      j["fairness"] = {{"timeSlot", game.time_slot},
                       {"seedSlice", game.seed_slice},
                       {"randomNumber", game.random_number},
                       {"distanceA", game.distance_a},
                       {"distanceB", game.distance_b}};
    }
  }
  return j;
}

json to_json(const storage::LedgerEntry &entry) {
  return json{{"id", entry.id},
              {"userId", entry.user_id},
              {"type", transaction_type_name(entry.type)},
              {"amountPoints", entry.amount},
              {"relatedOrderId", optional_json(entry.related_order_id)},
              {"relatedMatchId", optional_json(entry.related_match_id)},
              {"description", entry.description},
              {"createdAt", entry.created_at}};
}

json to_json(const orchestrator::SubmitResult &result) {
  json j{{"submitted", result.submitted},
         {"bothReady", result.both_ready},
         {"myNumber", result.my_number},
         {"roundNumber", result.round_number}};
  if (result.both_ready) {
    j["game"] = to_json(result.game);
  }
  return j;
}

json to_json(const orchestrator::RoundStatus &status) {
  return json{{"gameId", status.game_id},
              {"matchId", status.match_id},
              {"roundNumber", status.round_number},
              {"myNumber", optional_json(status.my_number)},
              {"opponentSubmitted", status.opponent_submitted},
              {"opponentNumber", optional_json(status.opponent_number)},
              {"deadline", status.deadline},
              {"status", storage::game_status_name(status.status)}};
}

json to_json(const orchestrator::UserStats &stats) {
  return json{{"userId", stats.user_id},
              {"username", stats.username},
              {"matchesPlayed", stats.matches_played},
              {"wins", stats.wins},
              {"losses", stats.losses},
              {"draws", stats.draws},
              {"netPoints", stats.net_points},
              {"balance", stats.balance},
              {"reliability", to_json(stats.reliability)}};
}

json to_json(const reliability::ReliabilityMetrics &metrics) {
  return json{{"userId", metrics.user_id},
              {"username", metrics.username},
              {"totalDeals", metrics.counters.total_deals},
              {"completedDeals", metrics.counters.completed_deals},
              {"missedConfirmations", metrics.counters.missed_confirmations},
              {"droppedBeforeMinGames",
               metrics.counters.dropped_before_min_games},
              {"coefficient", metrics.coefficient},
              {"rank", reliability::rank_name(metrics.rank)},
              {"display", reliability::ReliabilityTracker::format(metrics)},
              {"showWarning",
               reliability::ReliabilityTracker::should_show_warning(metrics)}};
}

json to_json(const fairness::RoundOutcome &outcome) {
  return json{{"duelId", outcome.params.duel_id},
              {"roundNumber", outcome.params.round_number},
              {"timeSlot", outcome.params.time_slot},
              {"playerA",
               {{"id", outcome.params.player_a.player_id},
                {"number", outcome.params.player_a.number}}},
              {"playerB",
               {{"id", outcome.params.player_b.player_id},
                {"number", outcome.params.player_b.number}}},
              {"randomNumber", outcome.random_number},
              {"distanceA", outcome.distance_a},
              {"distanceB", outcome.distance_b},
              {"winner", fairness::winner_name(outcome.winner)},
              {"winnerId", optional_json(outcome.winner_id)},
              {"isDraw", outcome.is_draw},
              {"seedInput", outcome.seed_input},
              {"seedSlice", outcome.seed_slice},
              {"formula", outcome.formula}};
}

json to_json(const fairness::VerificationResult &result) {
  return json{{"isValid", result.is_valid},
              {"randomNumber", result.random_number},
              {"distanceA", result.distance_a},
              {"distanceB", result.distance_b},
              {"winner", fairness::winner_name(result.expected_winner)},
              {"message", result.message}};
}

json success_envelope(json data) {
  return json{{"success", true}, {"data", std::move(data)}};
}

json error_envelope(ErrorCode code, const std::string &message) {
  return json{{"success", false},
              {"error", {{"code", error_code_name(code)}, {"message", message}}}};
}

} // namespace engine
} // namespace fairduel
