#pragma once

#include "common/chips.h"
#include "common/config.h"
#include "common/types.h"
#include "notify/notification.h"
#include "reliability/tracker.h"
#include "scheduling/timeout_coordinator.h"
#include "storage/duel_store.h"
#include <memory>
#include <optional>
#include <vector>

namespace fairduel {
namespace matching {

using namespace fairduel::common;
using storage::MatchRecord;
using storage::OrderRecord;
using storage::OrderStatus;

struct ConfirmResult {
  OrderRecord order;
  MatchRecord match;
};

/**
 * @brief Order book state machine
 *
 * OPEN -> WAITING_CREATOR_CONFIRM -> MATCHED, with OPEN -> CANCELLED and
 * WAITING_CREATOR_CONFIRM -> OPEN | EXPIRED on confirmation timeout. Every
 * transition runs in one store transaction together with the stake
 * movement it causes, so a debit is never visible without its transition.
 *
 * Matching does not start rounds; the MatchOrchestrator picks up the
 * MATCHED order returned by confirm().
 */
class OrderMatcher {
public:
  OrderMatcher(std::shared_ptr<storage::DuelStore> store, EngineConfig config,
               std::shared_ptr<notify::NotificationDispatcher> notifier,
               std::shared_ptr<scheduling::TimeoutCoordinator> timeouts);

  /// Escrows stake_per_game * games_planned from the owner
  Result<OrderRecord> create(const Caller &owner, ChipType chip_type,
                             uint32_t games_planned);

  /**
   * @brief Take an OPEN order
   *
   * Exactly one of any number of concurrent joiners succeeds; the others
   * get NOT_AVAILABLE and are not debited.
   */
  Result<OrderRecord> join(const OrderId &order_id, const Caller &joiner);

  /// EXPIRED once the confirmation deadline has passed
  Result<ConfirmResult> confirm(const OrderId &order_id, const Caller &owner);

  /// Only from OPEN; refunds the owner
  Result<OrderRecord> cancel(const OrderId &order_id, const Caller &owner);

  /**
   * @brief Confirmation timeout handler
   *
   * No-op unless the order is still WAITING_CREATOR_CONFIRM and past its
   * deadline. Returns the order as it stands afterwards.
   */
  Result<OrderRecord> expire_confirmation(const OrderId &order_id);

  std::optional<OrderRecord> get(const OrderId &order_id) const;

  /// Newest first
  std::vector<OrderRecord> open_orders() const;
  std::vector<OrderRecord> orders_for_user(const UserId &user_id) const;

private:
  std::shared_ptr<storage::DuelStore> store_;
  EngineConfig config_;
  reliability::ReliabilityTracker tracker_;
  std::shared_ptr<notify::NotificationDispatcher> notifier_;
  std::shared_ptr<scheduling::TimeoutCoordinator> timeouts_;

  Result<bool> check_admission(const storage::UserRecord &user) const;
  void notify(notify::NotificationType type, const UserId &user_id,
              const std::string &message, const OrderRecord &order) const;
};

} // namespace matching
} // namespace fairduel
