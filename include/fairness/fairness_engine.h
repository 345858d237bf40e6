#pragma once

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>

namespace fairduel {
namespace fairness {

using namespace fairduel::common;

/// Outcomes are reproducible within one 30 second window
constexpr TimestampMs TIME_SLOT_DURATION_MS = 30 * 1000;

/// Hex characters of the HMAC published for verification (32 bits)
constexpr size_t SEED_SLICE_LENGTH = 8;

constexpr int64_t MIN_PLAYER_NUMBER = 0;
constexpr int64_t MAX_PLAYER_NUMBER = 999999;
constexpr uint32_t RANDOM_NUMBER_MODULUS = 1000000;

enum class Winner { PLAYER_A, PLAYER_B, DRAW };

const char *winner_name(Winner winner) noexcept;
std::optional<Winner> parse_winner(const std::string &text);

struct PlayerEntry {
  std::string player_id;
  int64_t number = 0;
};

/**
 * @brief Inputs of one round
 */
struct RoundParams {
  std::string duel_id;
  uint32_t round_number = 0;
  int64_t time_slot = 0;
  PlayerEntry player_a;
  PlayerEntry player_b;
};

/**
 * @brief Result of one round together with everything needed to audit it
 */
struct RoundOutcome {
  RoundParams params;
  uint32_t random_number = 0;
  int64_t distance_a = 0;
  int64_t distance_b = 0;
  Winner winner = Winner::DRAW;
  std::optional<std::string> winner_id;
  bool is_draw = false;
  std::string seed_input;
  std::string seed_slice;
  std::string formula;
};

/**
 * @brief Outcome of a public verification
 */
struct VerificationResult {
  bool is_valid = false;
  uint32_t random_number = 0;
  int64_t distance_a = 0;
  int64_t distance_b = 0;
  Winner expected_winner = Winner::DRAW;
  std::string message;
};

struct DisplaySteps {
  std::string summary;
  std::vector<std::string> steps;
  std::string result;
};

int64_t calculate_time_slot(TimestampMs now_ms);
TimestampMs time_until_next_slot(TimestampMs now_ms);

inline bool is_valid_player_number(int64_t number) noexcept {
  return number >= MIN_PLAYER_NUMBER && number <= MAX_PLAYER_NUMBER;
}

/// Strictly smaller distance wins; equal distances are a draw
Winner compare_distances(int64_t distance_a, int64_t distance_b) noexcept;

/**
 * @brief Map an 8 hex character seed slice to [0, 999999]
 * @return VERIFICATION error for anything that is not exactly 8 hex digits
 */
Result<uint32_t> random_number_from_seed_slice(const std::string &seed_slice);

/// Lowercase hex HMAC-SHA256 of message under key
Result<std::string> hmac_sha256_hex(const std::string &key,
                                    const std::string &message);

/**
 * @brief Provably fair round resolution
 *
 * seedInput = duelId:round:timeSlot:playerAId:numberA:playerBId:numberB
 * seedSlice = HMAC-SHA256(secret, seedInput)[0:8]
 * random    = parseHex(seedSlice) mod 1,000,000
 * winner    = player whose number is strictly closer to random
 *
 * determine_winner() is pure: identical inputs always yield identical
 * outcomes. verify_result() needs only the published seed slice, so anyone
 * can audit a round without the platform secret.
 */
class FairnessEngine {
public:
  /// @throws std::runtime_error if the secret is empty
  explicit FairnessEngine(std::string platform_secret);

  Result<RoundOutcome> determine_winner(const RoundParams &params) const;

  static Result<VerificationResult> verify_result(const std::string &seed_slice,
                                                  int64_t player_a_number,
                                                  int64_t player_b_number,
                                                  Winner claimed_winner);

  static std::string build_seed_input(const RoundParams &params);
  static DisplaySteps format_for_display(const RoundOutcome &outcome);

  /// URL query string carrying everything a third party needs to re-check
  static std::string verification_query(const RoundOutcome &outcome);

private:
  std::string platform_secret_;
};

} // namespace fairness
} // namespace fairduel
