#include "engine/duel_engine.h"
#include "common/logging.h"
#include "engine/dto.h"
#include <stdexcept>

namespace fairduel {
namespace engine {

using storage::StoreTransaction;
using storage::UserRecord;

namespace {

std::string param_string(const json &params, const char *key) {
  if (params.is_object() && params.contains(key) && params.at(key).is_string()) {
    return params.at(key).get<std::string>();
  }
  return "";
}

template <typename T, typename Fn>
json respond(const Result<T> &result, Fn &&encode) {
  if (result.is_err()) {
    return error_envelope(result);
  }
  return success_envelope(encode(result.value()));
}

template <typename T> json array_of(const std::vector<T> &items) {
  json out = json::array();
  for (const auto &item : items) {
    out.push_back(to_json(item));
  }
  return out;
}

} // namespace

DuelEngine::DuelEngine(const EngineConfig &config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(std::move(clock)),
      tracker_(reliability::ReliabilityPolicy{config.min_reliability_to_trade}) {
  std::string error = ConfigManager::validate_config(config_);
  if (!error.empty()) {
    throw std::invalid_argument("Invalid engine configuration: " + error);
  }
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }

  // Throws when the secret is missing
  fairness_ = std::make_shared<fairness::FairnessEngine>(
      ConfigManager::resolve_platform_secret(config_));

  store_ = std::make_shared<storage::DuelStore>(clock_);
  notifier_ =
      std::make_shared<notify::NotificationDispatcher>(config_.async_notifications);
  timeouts_ = std::make_shared<scheduling::TimeoutCoordinator>(
      clock_, config_.sweep_interval);
  matcher_ = std::make_unique<matching::OrderMatcher>(store_, config_,
                                                      notifier_, timeouts_);
  orchestrator_ = std::make_unique<orchestrator::MatchOrchestrator>(
      store_, config_, fairness_, notifier_, timeouts_);

  timeouts_->register_handler(
      scheduling::TimeoutKind::CONFIRMATION, [this](const std::string &id) {
        auto result = matcher_->expire_confirmation(id);
        if (result.is_err()) {
          LOG_ERROR("engine", "Confirmation timeout for ", id,
                    " failed: ", result.error());
        }
      });
  timeouts_->register_handler(
      scheduling::TimeoutKind::ROUND, [this](const std::string &id) {
        auto result = orchestrator_->handle_round_timeout(id);
        if (result.is_err()) {
          LOG_ERROR("engine", "Round timeout for ", id,
                    " failed: ", result.error());
        }
      });

  LOG_INFO("engine", "Duel engine ready (confirmation timeout ",
           config_.confirmation_timeout.count(), "ms, round ceiling ",
           config_.round_ceiling.count(), "ms)");
}

DuelEngine::~DuelEngine() {
  stop();
  notifier_->shutdown();
}

bool DuelEngine::start() { return timeouts_->start(); }

void DuelEngine::stop() { timeouts_->stop(); }

size_t DuelEngine::run_due_timeouts() { return timeouts_->run_due(); }

void DuelEngine::flush_notifications() { notifier_->flush(); }

void DuelEngine::add_notification_sink(
    std::shared_ptr<notify::INotificationSink> sink) {
  notifier_->add_sink(std::move(sink));
}

Result<UserRecord> DuelEngine::register_user(const UserId &user_id,
                                             const std::string &username,
                                             Points initial_balance) {
  if (user_id.empty()) {
    return Result<UserRecord>(ErrorCode::VALIDATION, "User id is required");
  }
  if (initial_balance < 0) {
    return Result<UserRecord>(ErrorCode::VALIDATION,
                              "Initial balance cannot be negative");
  }

  return store_->transact([&](StoreTransaction &tx) -> Result<UserRecord> {
    UserRecord user;
    user.id = user_id;
    user.username = username;
    user.created_at = tx.now();
    auto inserted = tx.insert_user(user);
    if (inserted.is_err()) {
      return Result<UserRecord>::from_error(inserted);
    }
    if (initial_balance > 0) {
      auto credited = tx.apply_balance_change(
          user_id, initial_balance, TransactionType::INITIAL_BALANCE,
          std::nullopt, std::nullopt, "Initial balance");
      if (credited.is_err()) {
        return Result<UserRecord>::from_error(credited);
      }
      user.points_balance = credited.value();
    }
    return Result<UserRecord>(user);
  });
}

std::optional<UserRecord> DuelEngine::get_user(const UserId &user_id) const {
  auto user = store_->get_user(user_id);
  if (!user) {
    return std::nullopt;
  }
  return user->value;
}

Result<storage::OrderRecord>
DuelEngine::create_order(const Caller &caller, const std::string &chip_type,
                         uint32_t games_planned) {
  auto chip = parse_chip_type(chip_type);
  if (!chip) {
    return Result<storage::OrderRecord>(ErrorCode::VALIDATION,
                                        "Unknown chip type: " + chip_type);
  }
  return matcher_->create(caller, *chip, games_planned);
}

Result<storage::OrderRecord> DuelEngine::join_order(const OrderId &order_id,
                                                    const Caller &caller) {
  return matcher_->join(order_id, caller);
}

Result<storage::MatchRecord> DuelEngine::confirm_order(const OrderId &order_id,
                                                       const Caller &caller) {
  auto confirmed = matcher_->confirm(order_id, caller);
  if (confirmed.is_err()) {
    if (confirmed.code() == ErrorCode::EXPIRED) {
      auto expired = matcher_->expire_confirmation(order_id);
      if (expired.is_err()) {
        LOG_ERROR("engine", "Failed to expire order ", order_id, ": ",
                  expired.error());
      }
    }
    return Result<storage::MatchRecord>::from_error(confirmed);
  }
  return orchestrator_->start_match(confirmed.value().match.id);
}

Result<storage::OrderRecord> DuelEngine::cancel_order(const OrderId &order_id,
                                                      const Caller &caller) {
  return matcher_->cancel(order_id, caller);
}

Result<orchestrator::SubmitResult>
DuelEngine::submit_number(const MatchId &match_id, const Caller &caller,
                          uint32_t round_number, int64_t player_number) {
  return orchestrator_->submit_for_round(match_id, caller, round_number,
                                         player_number);
}

Result<orchestrator::RoundStatus>
DuelEngine::round_status(const MatchId &match_id, const Caller &caller) const {
  return orchestrator_->round_status(match_id, caller);
}

Result<fairness::VerificationResult>
DuelEngine::verify(const std::string &seed_slice, int64_t player_a_number,
                   int64_t player_b_number, fairness::Winner claimed_winner) {
  return fairness::FairnessEngine::verify_result(seed_slice, player_a_number,
                                                 player_b_number, claimed_winner);
}

Result<reliability::ReliabilityMetrics>
DuelEngine::reliability(const UserId &user_id) const {
  auto user = store_->get_user(user_id);
  if (!user) {
    return Result<reliability::ReliabilityMetrics>(
        ErrorCode::NOT_FOUND, "User not found: " + user_id);
  }
  return Result<reliability::ReliabilityMetrics>(tracker_.metrics(
      user_id, user->value.username, user->value.reliability));
}

std::vector<reliability::ReliabilityMetrics>
DuelEngine::leaderboard(size_t limit) const {
  std::vector<reliability::ReliabilityMetrics> metrics;
  for (const auto &user :
       store_->select_users([](const UserRecord &) { return true; })) {
    metrics.push_back(tracker_.metrics(user.id, user.username, user.reliability));
  }
  return reliability::ReliabilityTracker::leaderboard(std::move(metrics), limit);
}

Result<orchestrator::UserStats>
DuelEngine::user_stats(const UserId &user_id) const {
  return orchestrator_->user_stats(user_id);
}

std::vector<storage::LedgerEntry>
DuelEngine::ledger_for_user(const UserId &user_id) const {
  return store_->select_ledger([&](const storage::LedgerEntry &entry) {
    return entry.user_id == user_id;
  });
}

Points DuelEngine::order_ledger_balance(const OrderId &order_id) const {
  return store_->order_ledger_balance(order_id);
}

json DuelEngine::execute(const std::string &command, const Caller &caller,
                         const json &params) {
  try {
    if (command == "create_order") {
      auto request = parse_create_order_request(params);
      if (request.is_err()) {
        return error_envelope(request);
      }
      return respond(matcher_->create(caller, request.value().chip_type,
                                      request.value().games_planned),
                     [](const storage::OrderRecord &o) { return to_json(o); });
    }
    if (command == "join_order") {
      return respond(join_order(param_string(params, "orderId"), caller),
                     [](const storage::OrderRecord &o) { return to_json(o); });
    }
    if (command == "confirm_order") {
      return respond(confirm_order(param_string(params, "orderId"), caller),
                     [](const storage::MatchRecord &m) { return to_json(m); });
    }
    if (command == "cancel_order") {
      return respond(cancel_order(param_string(params, "orderId"), caller),
                     [](const storage::OrderRecord &o) { return to_json(o); });
    }
    if (command == "submit") {
      auto request = parse_submit_request(params);
      if (request.is_err()) {
        return error_envelope(request);
      }
      return respond(submit_number(param_string(params, "matchId"), caller,
                                   request.value().round_number,
                                   request.value().player_number),
                     [](const orchestrator::SubmitResult &r) { return to_json(r); });
    }
    if (command == "round_status") {
      return respond(round_status(param_string(params, "matchId"), caller),
                     [](const orchestrator::RoundStatus &s) { return to_json(s); });
    }
    if (command == "get_order") {
      auto order = matcher_->get(param_string(params, "orderId"));
      if (!order) {
        return error_envelope(ErrorCode::NOT_FOUND, "Order not found");
      }
      return success_envelope(to_json(*order));
    }
    if (command == "get_match") {
      auto match = orchestrator_->get_match(param_string(params, "matchId"));
      if (!match) {
        return error_envelope(ErrorCode::NOT_FOUND, "Match not found");
      }
      return success_envelope(to_json(*match));
    }
    if (command == "games") {
      return success_envelope(array_of(
          orchestrator_->games_for_match(param_string(params, "matchId"))));
    }
    if (command == "open_orders") {
      return success_envelope(array_of(matcher_->open_orders()));
    }
    if (command == "my_orders") {
      return success_envelope(array_of(matcher_->orders_for_user(caller.user_id)));
    }
    if (command == "verify") {
      auto request = parse_verify_request(params);
      if (request.is_err()) {
        return error_envelope(request);
      }
      const auto &r = request.value();
      return respond(verify(r.seed_slice, r.player_a_number, r.player_b_number,
                            r.claimed_winner),
                     [](const fairness::VerificationResult &v) { return to_json(v); });
    }
    if (command == "reliability") {
      std::string user_id = param_string(params, "userId");
      return respond(reliability(user_id.empty() ? caller.user_id : user_id),
                     [](const reliability::ReliabilityMetrics &m) {
                       return to_json(m);
                     });
    }
    if (command == "leaderboard") {
      size_t limit = 10;
      if (params.is_object() && params.contains("limit")) {
        const auto &value = params.at("limit");
        if (!value.is_number_integer() || value.get<int64_t>() < 1) {
          return error_envelope(ErrorCode::VALIDATION,
                                "limit must be a positive integer");
        }
        limit = static_cast<size_t>(value.get<int64_t>());
      }
      return success_envelope(array_of(leaderboard(limit)));
    }
    if (command == "stats") {
      return respond(user_stats(caller.user_id),
                     [](const orchestrator::UserStats &s) { return to_json(s); });
    }
    if (command == "ledger") {
      return success_envelope(array_of(ledger_for_user(caller.user_id)));
    }
  } catch (const json::exception &e) {
    LOG_WARN("engine", "Malformed ", command, " request: ", e.what());
    return error_envelope(ErrorCode::VALIDATION,
                          std::string("Malformed request: ") + e.what());
  }

  return error_envelope(ErrorCode::VALIDATION, "Unknown command: " + command);
}

} // namespace engine
} // namespace fairduel
