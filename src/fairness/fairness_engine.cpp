/**
 * @file fairness_engine.cpp
 * @brief HMAC-SHA256 distance formula and its secret-free verification
 */
#include "fairness/fairness_engine.h"
#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>
#include <stdexcept>

namespace fairduel {
namespace fairness {

namespace {

std::string to_hex(const unsigned char *data, size_t length) {
  std::ostringstream oss;
  for (size_t i = 0; i < length; ++i) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string url_encode(const std::string &value) {
  std::ostringstream escaped;
  escaped << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << std::setw(2) << std::setfill('0')
              << static_cast<int>(c);
    }
  }
  return escaped.str();
}

int64_t absolute_distance(int64_t number, uint32_t random_number) {
  int64_t delta = number - static_cast<int64_t>(random_number);
  return delta < 0 ? -delta : delta;
}

} // namespace

const char *winner_name(Winner winner) noexcept {
  switch (winner) {
  case Winner::PLAYER_A:
    return "A";
  case Winner::PLAYER_B:
    return "B";
  case Winner::DRAW:
    return "DRAW";
  }
  return "DRAW";
}

std::optional<Winner> parse_winner(const std::string &text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "A" || upper == "0")
    return Winner::PLAYER_A;
  if (upper == "B" || upper == "1")
    return Winner::PLAYER_B;
  if (upper == "DRAW" || upper == "-1")
    return Winner::DRAW;
  return std::nullopt;
}

int64_t calculate_time_slot(TimestampMs now_ms) {
  int64_t slot = now_ms / TIME_SLOT_DURATION_MS;
  if (now_ms < 0 && now_ms % TIME_SLOT_DURATION_MS != 0) {
    --slot;
  }
  return slot;
}

TimestampMs time_until_next_slot(TimestampMs now_ms) {
  return (calculate_time_slot(now_ms) + 1) * TIME_SLOT_DURATION_MS - now_ms;
}

Winner compare_distances(int64_t distance_a, int64_t distance_b) noexcept {
  if (distance_a < distance_b)
    return Winner::PLAYER_A;
  if (distance_b < distance_a)
    return Winner::PLAYER_B;
  return Winner::DRAW;
}

Result<uint32_t> random_number_from_seed_slice(const std::string &seed_slice) {
  if (seed_slice.size() != SEED_SLICE_LENGTH) {
    return Result<uint32_t>(ErrorCode::VERIFICATION,
                            "Seed slice must be exactly 8 hex characters");
  }

  uint32_t value = 0;
  for (char c : seed_slice) {
    uint32_t digit;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return Result<uint32_t>(ErrorCode::VERIFICATION,
                              "Invalid seed slice format (must be hex)");
    }
    value = (value << 4) | digit;
  }

  return Result<uint32_t>(value % RANDOM_NUMBER_MODULUS);
}

Result<std::string> hmac_sha256_hex(const std::string &key,
                                    const std::string &message) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  unsigned char *out =
      HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(message.data()),
           message.size(), digest, &digest_len);
  if (out == nullptr || digest_len == 0) {
    return Result<std::string>(ErrorCode::INTERNAL, "HMAC-SHA256 failed");
  }

  return Result<std::string>(to_hex(digest, digest_len), success_tag{});
}

FairnessEngine::FairnessEngine(std::string platform_secret)
    : platform_secret_(std::move(platform_secret)) {
  if (platform_secret_.empty()) {
    throw std::runtime_error("Fairness engine requires a platform secret");
  }
}

std::string FairnessEngine::build_seed_input(const RoundParams &params) {
  std::ostringstream oss;
  oss << params.duel_id << ':' << params.round_number << ':'
      << params.time_slot << ':' << params.player_a.player_id << ':'
      << params.player_a.number << ':' << params.player_b.player_id << ':'
      << params.player_b.number;
  return oss.str();
}

Result<RoundOutcome>
FairnessEngine::determine_winner(const RoundParams &params) const {
  if (!is_valid_player_number(params.player_a.number) ||
      !is_valid_player_number(params.player_b.number)) {
    return Result<RoundOutcome>(ErrorCode::VALIDATION,
                                "Invalid number (must be 0-999999)");
  }

  RoundOutcome outcome;
  outcome.params = params;
  outcome.seed_input = build_seed_input(params);

  auto hmac = hmac_sha256_hex(platform_secret_, outcome.seed_input);
  if (hmac.is_err()) {
    return Result<RoundOutcome>::from_error(hmac);
  }
  outcome.seed_slice = hmac.value().substr(0, SEED_SLICE_LENGTH);

  auto random_number = random_number_from_seed_slice(outcome.seed_slice);
  if (random_number.is_err()) {
    return Result<RoundOutcome>::from_error(random_number);
  }
  outcome.random_number = random_number.value();

  outcome.distance_a =
      absolute_distance(params.player_a.number, outcome.random_number);
  outcome.distance_b =
      absolute_distance(params.player_b.number, outcome.random_number);
  outcome.winner = compare_distances(outcome.distance_a, outcome.distance_b);
  outcome.is_draw = outcome.winner == Winner::DRAW;
  if (outcome.winner == Winner::PLAYER_A) {
    outcome.winner_id = params.player_a.player_id;
  } else if (outcome.winner == Winner::PLAYER_B) {
    outcome.winner_id = params.player_b.player_id;
  }

  std::ostringstream formula;
  formula << "HMAC-SHA256(secret, \"" << outcome.seed_input << "\")[0:8] = \""
          << outcome.seed_slice << "\" -> " << outcome.random_number
          << "; |" << params.player_a.number << " - " << outcome.random_number
          << "| = " << outcome.distance_a << ", |" << params.player_b.number
          << " - " << outcome.random_number << "| = " << outcome.distance_b
          << " -> " << winner_name(outcome.winner);
  outcome.formula = formula.str();

  LOG_DEBUG("fairness", "Round ", params.duel_id, "#", params.round_number,
            " seed=", outcome.seed_slice, " random=", outcome.random_number,
            " winner=", winner_name(outcome.winner));

  return Result<RoundOutcome>(std::move(outcome));
}

Result<VerificationResult>
FairnessEngine::verify_result(const std::string &seed_slice,
                              int64_t player_a_number, int64_t player_b_number,
                              Winner claimed_winner) {
  if (!is_valid_player_number(player_a_number) ||
      !is_valid_player_number(player_b_number)) {
    return Result<VerificationResult>(ErrorCode::VALIDATION,
                                      "Invalid number (must be 0-999999)");
  }

  auto random_number = random_number_from_seed_slice(seed_slice);
  if (random_number.is_err()) {
    return Result<VerificationResult>::from_error(random_number);
  }

  VerificationResult result;
  result.random_number = random_number.value();
  result.distance_a = absolute_distance(player_a_number, result.random_number);
  result.distance_b = absolute_distance(player_b_number, result.random_number);
  result.expected_winner = compare_distances(result.distance_a,
                                             result.distance_b);
  result.is_valid = result.expected_winner == claimed_winner;
  result.message = result.is_valid
                       ? "Result verified: the winner was determined fairly"
                       : "Verification failed: claimed winner does not match";

  return Result<VerificationResult>(std::move(result));
}

DisplaySteps FairnessEngine::format_for_display(const RoundOutcome &outcome) {
  DisplaySteps display;

  std::ostringstream summary;
  summary << "Duel " << outcome.params.duel_id << ", Round "
          << outcome.params.round_number;
  display.summary = summary.str();

  display.steps.push_back("1. Seed Input: \"" + outcome.seed_input + "\"");
  display.steps.push_back("2. HMAC-SHA256 computed with the platform secret");
  display.steps.push_back("3. Seed Slice (first 8 chars): \"" +
                          outcome.seed_slice + "\"");
  display.steps.push_back("4. Random number: parseHex(seed slice) mod 1000000 = " +
                          std::to_string(outcome.random_number));
  display.steps.push_back("5. Distance A: |" +
                          std::to_string(outcome.params.player_a.number) +
                          " - " + std::to_string(outcome.random_number) +
                          "| = " + std::to_string(outcome.distance_a));
  display.steps.push_back("6. Distance B: |" +
                          std::to_string(outcome.params.player_b.number) +
                          " - " + std::to_string(outcome.random_number) +
                          "| = " + std::to_string(outcome.distance_b));

  switch (outcome.winner) {
  case Winner::PLAYER_A:
    display.result = "Winner: Player A (" + outcome.params.player_a.player_id + ")";
    break;
  case Winner::PLAYER_B:
    display.result = "Winner: Player B (" + outcome.params.player_b.player_id + ")";
    break;
  case Winner::DRAW:
    display.result = "Draw: equal distances";
    break;
  }

  return display;
}

std::string FairnessEngine::verification_query(const RoundOutcome &outcome) {
  const auto &p = outcome.params;
  std::ostringstream query;
  query << "duelId=" << url_encode(p.duel_id) << "&round=" << p.round_number
        << "&timeSlot=" << p.time_slot
        << "&playerA=" << url_encode(p.player_a.player_id)
        << "&numberA=" << p.player_a.number
        << "&playerB=" << url_encode(p.player_b.player_id)
        << "&numberB=" << p.player_b.number
        << "&seedSlice=" << outcome.seed_slice
        << "&winner=" << winner_name(outcome.winner);
  return query.str();
}

} // namespace fairness
} // namespace fairduel
