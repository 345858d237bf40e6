#pragma once

#include "common/types.h"
#include "fairness/fairness_engine.h"
#include "orchestrator/match_orchestrator.h"
#include "reliability/tracker.h"
#include "storage/records.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fairduel {
namespace engine {

using namespace fairduel::common;
using json = nlohmann::json;

/**
 * @file dto.h
 * @brief JSON encodings of the engine's request and response objects
 *
 * Field names are camelCase on the wire. Optional record fields are
 * emitted as null.
 */

struct CreateOrderRequest {
  ChipType chip_type = ChipType::SMILE;
  uint32_t games_planned = 0;
};

struct SubmitRequest {
  uint32_t round_number = 0;
  int64_t player_number = 0;
};

struct VerifyRequest {
  std::string seed_slice;
  int64_t player_a_number = 0;
  int64_t player_b_number = 0;
  fairness::Winner claimed_winner = fairness::Winner::DRAW;
};

// Requests: every parser reports malformed input as VALIDATION
Result<CreateOrderRequest> parse_create_order_request(const json &body);
Result<SubmitRequest> parse_submit_request(const json &body);
Result<VerifyRequest> parse_verify_request(const json &body);

json to_json(const storage::UserRecord &user);
json to_json(const storage::OrderRecord &order);
json to_json(const storage::MatchRecord &match);
json to_json(const storage::GameRecord &game);
json to_json(const storage::LedgerEntry &entry);
json to_json(const orchestrator::SubmitResult &result);
json to_json(const orchestrator::RoundStatus &status);
json to_json(const orchestrator::UserStats &stats);
json to_json(const reliability::ReliabilityMetrics &metrics);
json to_json(const fairness::RoundOutcome &outcome);
json to_json(const fairness::VerificationResult &result);

/// {"success": true, "data": ...}
json success_envelope(json data);

/// {"success": false, "error": {"code": ..., "message": ...}}
json error_envelope(ErrorCode code, const std::string &message);

template <typename T> json error_envelope(const Result<T> &result) {
  return error_envelope(result.code(), result.error());
}

} // namespace engine
} // namespace fairduel
