#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace fairduel {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and the Result<T> wrapper shared by every module
 *
 * Identifiers are opaque strings issued either by the auth collaborator
 * (users) or by the duel store (orders, matches, games, ledger entries).
 */

/// @brief Points amount; debits are negative in the ledger
using Points = int64_t;

/// @brief Milliseconds since the Unix epoch
using TimestampMs = int64_t;

using UserId = std::string;
using OrderId = std::string;
using MatchId = std::string;
using GameId = std::string;

/// @brief Minimum number of finished rounds before rewards are released
constexpr uint32_t MIN_GAMES_REQUIRED = 2;

/// @brief Bounds on the number of rounds an order may plan
constexpr uint32_t MIN_GAMES_PLANNED = 2;
constexpr uint32_t MAX_GAMES_PLANNED = 10;

/**
 * @brief Player position inside a match
 *
 * Side A is always the order owner, side B the joiner.
 */
enum class Side { A, B };

inline Side other_side(Side side) noexcept {
  return side == Side::A ? Side::B : Side::A;
}

inline const char *side_name(Side side) noexcept {
  return side == Side::A ? "A" : "B";
}

/**
 * @brief Kind of a ledger entry
 *
 * Every balance mutation is recorded as exactly one entry of one of
 * these kinds.
 */
enum class TransactionType {
  INITIAL_BALANCE,
  STAKE_LOCK,   ///< Debit when a stake is escrowed (create/join)
  STAKE_REFUND, ///< Stake returned on cancel, timeout, draw or abandonment
  STAKE_RETURN, ///< Winner's own stake returned on a decisive series
  DUEL_WIN,     ///< Opponent's stake credited to the series winner
  FORFEIT_WIN   ///< Both stakes credited to the non-forfeiting player
};

const char *transaction_type_name(TransactionType type) noexcept;

/**
 * @brief Error categories surfaced by core operations
 *
 * NOT_AVAILABLE, SELF_JOIN, NOT_OWNER, NOT_PARTICIPANT, EXPIRED and
 * ALREADY_SUBMITTED are state conflicts; is_state_conflict() groups them.
 */
enum class ErrorCode {
  OK = 0,
  VALIDATION,
  NOT_FOUND,
  STATE_CONFLICT,
  NOT_AVAILABLE,
  SELF_JOIN,
  NOT_OWNER,
  NOT_PARTICIPANT,
  EXPIRED,
  ALREADY_SUBMITTED,
  INSUFFICIENT_BALANCE,
  VERIFICATION,
  INTERNAL
};

const char *error_code_name(ErrorCode code) noexcept;

inline bool is_state_conflict(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::STATE_CONFLICT:
  case ErrorCode::NOT_AVAILABLE:
  case ErrorCode::SELF_JOIN:
  case ErrorCode::NOT_OWNER:
  case ErrorCode::NOT_PARTICIPANT:
  case ErrorCode::EXPIRED:
  case ErrorCode::ALREADY_SUBMITTED:
    return true;
  default:
    return false;
  }
}

/**
 * @brief Identity of an authenticated caller
 *
 * Session handling lives outside the engine; every mutating call carries
 * an already validated caller.
 */
struct Caller {
  UserId user_id;
  std::string username;
};

/// @brief Disambiguates the success constructor when T is itself a string
struct success_tag {};

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Carries either a value or an ErrorCode plus a human readable message.
 * Failures never throw; callers branch on is_ok()/is_err().
 *
 * @tparam T The type of the success value (must be default constructible)
 *
 * @code
 * auto result = matcher.join(order_id, caller);
 * if (result.is_err() && result.code() == ErrorCode::NOT_AVAILABLE) {
 *   // somebody else got there first
 * }
 * @endcode
 */
template <typename T> class Result {
private:
  bool success_;
  T value_;
  ErrorCode code_;
  std::string error_;

public:
  /// @brief Construct a successful result with a value
  explicit Result(T value)
      : success_(true), value_(std::move(value)), code_(ErrorCode::OK) {}

  /// @brief Construct a successful result when T is convertible from a string
  Result(T value, success_tag)
      : success_(true), value_(std::move(value)), code_(ErrorCode::OK) {}

  /// @brief Construct a failed result with an explicit error category
  Result(ErrorCode code, std::string error)
      : success_(false), value_(), code_(code), error_(std::move(error)) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  /// @brief Re-wrap the failure of a result of another type
  template <typename U> static Result from_error(const Result<U> &other) {
    return Result(other.code(), other.error());
  }

  bool is_ok() const noexcept { return success_; }
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }
  T &&value() && { return std::move(value_); }

  ErrorCode code() const noexcept { return code_; }
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace fairduel
