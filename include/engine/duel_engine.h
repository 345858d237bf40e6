#pragma once

#include "common/clock.h"
#include "common/config.h"
#include "common/types.h"
#include "fairness/fairness_engine.h"
#include "matching/order_matcher.h"
#include "notify/notification.h"
#include "orchestrator/match_orchestrator.h"
#include "reliability/tracker.h"
#include "scheduling/timeout_coordinator.h"
#include "storage/duel_store.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace fairduel {
namespace engine {

using namespace fairduel::common;

/**
 * @brief Composition root of the duel engine
 *
 * Wires the store, matcher, orchestrator, timeout coordinator and
 * notification dispatcher together and exposes the operations a transport
 * layer needs. Both typed calls and a JSON command surface (execute()) are
 * provided.
 *
 * Construction resolves the platform secret and throws if it is missing;
 * an engine that cannot sign rounds must not start.
 */
class DuelEngine {
public:
  explicit DuelEngine(const EngineConfig &config,
                      std::shared_ptr<Clock> clock = nullptr);
  ~DuelEngine();

  DuelEngine(const DuelEngine &) = delete;
  DuelEngine &operator=(const DuelEngine &) = delete;

  /// Start the background timeout sweeper
  bool start();
  void stop();

  /// Fire due timeouts synchronously; returns the number handled
  size_t run_due_timeouts();
  void flush_notifications();
  void add_notification_sink(std::shared_ptr<notify::INotificationSink> sink);

  /// Users come from the auth collaborator; the starting balance is
  /// recorded as an INITIAL_BALANCE ledger entry
  Result<storage::UserRecord> register_user(const UserId &user_id,
                                            const std::string &username,
                                            Points initial_balance);
  std::optional<storage::UserRecord> get_user(const UserId &user_id) const;

  Result<storage::OrderRecord> create_order(const Caller &caller,
                                            const std::string &chip_type,
                                            uint32_t games_planned);
  Result<storage::OrderRecord> join_order(const OrderId &order_id,
                                          const Caller &caller);

  /**
   * @brief Confirm a joined order and start its match
   *
   * A confirmation after the deadline resolves the timeout on the spot and
   * reports EXPIRED.
   */
  Result<storage::MatchRecord> confirm_order(const OrderId &order_id,
                                             const Caller &caller);
  Result<storage::OrderRecord> cancel_order(const OrderId &order_id,
                                            const Caller &caller);

  Result<orchestrator::SubmitResult> submit_number(const MatchId &match_id,
                                                   const Caller &caller,
                                                   uint32_t round_number,
                                                   int64_t player_number);
  Result<orchestrator::RoundStatus> round_status(const MatchId &match_id,
                                                 const Caller &caller) const;

  /// Public verification; needs no secret
  static Result<fairness::VerificationResult>
  verify(const std::string &seed_slice, int64_t player_a_number,
         int64_t player_b_number, fairness::Winner claimed_winner);

  Result<reliability::ReliabilityMetrics>
  reliability(const UserId &user_id) const;
  std::vector<reliability::ReliabilityMetrics> leaderboard(size_t limit) const;
  Result<orchestrator::UserStats> user_stats(const UserId &user_id) const;

  std::vector<storage::LedgerEntry> ledger_for_user(const UserId &user_id) const;
  Points order_ledger_balance(const OrderId &order_id) const;

  /**
   * @brief JSON command surface
   *
   * Commands: create_order, join_order, confirm_order, cancel_order,
   * submit, round_status, get_order, get_match, games, open_orders,
   * my_orders, verify, reliability, leaderboard, stats, ledger.
   *
   * @return success or error envelope; never throws for bad input
   */
  nlohmann::json execute(const std::string &command, const Caller &caller,
                         const nlohmann::json &params);

  matching::OrderMatcher &matcher() { return *matcher_; }
  orchestrator::MatchOrchestrator &orchestrator() { return *orchestrator_; }
  storage::DuelStore &store() { return *store_; }
  scheduling::TimeoutCoordinator &timeouts() { return *timeouts_; }
  const EngineConfig &config() const { return config_; }

private:
  EngineConfig config_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<storage::DuelStore> store_;
  std::shared_ptr<notify::NotificationDispatcher> notifier_;
  std::shared_ptr<scheduling::TimeoutCoordinator> timeouts_;
  std::shared_ptr<const fairness::FairnessEngine> fairness_;
  std::unique_ptr<matching::OrderMatcher> matcher_;
  std::unique_ptr<orchestrator::MatchOrchestrator> orchestrator_;
  reliability::ReliabilityTracker tracker_;
};

} // namespace engine
} // namespace fairduel
