#include "common/types.h"

namespace fairduel {
namespace common {

const char *transaction_type_name(TransactionType type) noexcept {
  switch (type) {
  case TransactionType::INITIAL_BALANCE:
    return "INITIAL_BALANCE";
  case TransactionType::STAKE_LOCK:
    return "STAKE_LOCK";
  case TransactionType::STAKE_REFUND:
    return "STAKE_REFUND";
  case TransactionType::STAKE_RETURN:
    return "STAKE_RETURN";
  case TransactionType::DUEL_WIN:
    return "DUEL_WIN";
  case TransactionType::FORFEIT_WIN:
    return "FORFEIT_WIN";
  }
  return "UNKNOWN";
}

const char *error_code_name(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::OK:
    return "OK";
  case ErrorCode::VALIDATION:
    return "VALIDATION_ERROR";
  case ErrorCode::NOT_FOUND:
    return "NOT_FOUND";
  case ErrorCode::STATE_CONFLICT:
    return "STATE_CONFLICT";
  case ErrorCode::NOT_AVAILABLE:
    return "NOT_AVAILABLE";
  case ErrorCode::SELF_JOIN:
    return "SELF_JOIN";
  case ErrorCode::NOT_OWNER:
    return "NOT_OWNER";
  case ErrorCode::NOT_PARTICIPANT:
    return "NOT_PARTICIPANT";
  case ErrorCode::EXPIRED:
    return "EXPIRED";
  case ErrorCode::ALREADY_SUBMITTED:
    return "ALREADY_SUBMITTED";
  case ErrorCode::INSUFFICIENT_BALANCE:
    return "INSUFFICIENT_BALANCE";
  case ErrorCode::VERIFICATION:
    return "VERIFICATION_ERROR";
  case ErrorCode::INTERNAL:
    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

} // namespace common
} // namespace fairduel
