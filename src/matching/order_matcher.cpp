#include "matching/order_matcher.h"
#include "common/logging.h"
#include <algorithm>

namespace fairduel {
namespace matching {

using notify::NotificationType;
using storage::StoreTransaction;
using storage::UserRecord;

OrderMatcher::OrderMatcher(
    std::shared_ptr<storage::DuelStore> store, EngineConfig config,
    std::shared_ptr<notify::NotificationDispatcher> notifier,
    std::shared_ptr<scheduling::TimeoutCoordinator> timeouts)
    : store_(std::move(store)), config_(std::move(config)),
      tracker_(reliability::ReliabilityPolicy{config_.min_reliability_to_trade}),
      notifier_(std::move(notifier)), timeouts_(std::move(timeouts)) {}

Result<bool> OrderMatcher::check_admission(const UserRecord &user) const {
  auto metrics = tracker_.metrics(user.id, user.username, user.reliability);
  if (!tracker_.can_trade(metrics)) {
    return Result<bool>(ErrorCode::VALIDATION,
                        "Reliability too low to trade: " +
                            reliability::ReliabilityTracker::format(metrics));
  }
  return Result<bool>(true);
}

void OrderMatcher::notify(NotificationType type, const UserId &user_id,
                          const std::string &message,
                          const OrderRecord &order) const {
  if (!notifier_)
    return;
  notify::Notification notification;
  notification.type = type;
  notification.user_id = user_id;
  notification.message = message;
  notification.context["order_id"] = order.id;
  notification.context["status"] = storage::order_status_name(order.status);
  if (order.confirmation_deadline) {
    notification.context["confirmation_deadline"] =
        std::to_string(*order.confirmation_deadline);
  }
  notification.created_at = store_->now();
  notifier_->publish(std::move(notification));
}

Result<OrderRecord> OrderMatcher::create(const Caller &owner,
                                         ChipType chip_type,
                                         uint32_t games_planned) {
  if (games_planned < config_.min_games_planned ||
      games_planned > config_.max_games_planned) {
    return Result<OrderRecord>(
        ErrorCode::VALIDATION,
        "gamesPlanned must be between " +
            std::to_string(config_.min_games_planned) + " and " +
            std::to_string(config_.max_games_planned));
  }
  const Points stake_per_game = chip_value(chip_type);
  if (stake_per_game <= 0) {
    return Result<OrderRecord>(ErrorCode::VALIDATION, "Unknown chip type");
  }

  auto result = store_->transact([&](StoreTransaction &tx) {
    auto user = tx.get_user(owner.user_id);
    if (!user) {
      return Result<OrderRecord>(ErrorCode::NOT_FOUND,
                                 "User not found: " + owner.user_id);
    }
    auto admitted = check_admission(user->value);
    if (admitted.is_err()) {
      return Result<OrderRecord>::from_error(admitted);
    }

    OrderRecord order;
    order.id = tx.next_id("order");
    order.owner_id = owner.user_id;
    order.chip_type = chip_type;
    order.stake_per_game = stake_per_game;
    order.games_planned = games_planned;
    order.status = OrderStatus::OPEN;
    order.created_at = tx.now();
    order.updated_at = order.created_at;

    auto debited = tx.apply_balance_change(
        owner.user_id, -order.total_stake(), TransactionType::STAKE_LOCK,
        order.id, std::nullopt,
        std::string("Stake locked: ") + chip_name(chip_type) + " x" +
            std::to_string(games_planned));
    if (debited.is_err()) {
      return Result<OrderRecord>::from_error(debited);
    }

    auto inserted = tx.insert_order(order);
    if (inserted.is_err()) {
      return Result<OrderRecord>::from_error(inserted);
    }
    return Result<OrderRecord>(order);
  });

  if (result.is_ok()) {
    LOG_INFO("matching", "Order ", result.value().id, " created by ",
             owner.user_id, " (", chip_name(chip_type), " x", games_planned,
             ")");
  }
  return result;
}

Result<OrderRecord> OrderMatcher::join(const OrderId &order_id,
                                       const Caller &joiner) {
  auto result = store_->transact([&](StoreTransaction &tx) {
    auto current = tx.get_order(order_id);
    if (!current) {
      return Result<OrderRecord>(ErrorCode::NOT_FOUND,
                                 "Order not found: " + order_id);
    }
    OrderRecord order = current->value;
    if (order.status != OrderStatus::OPEN) {
      return Result<OrderRecord>(ErrorCode::NOT_AVAILABLE,
                                 "Order is not available: " +
                                     std::string(storage::order_status_name(
                                         order.status)));
    }
    if (order.owner_id == joiner.user_id) {
      return Result<OrderRecord>(ErrorCode::SELF_JOIN,
                                 "Cannot join your own order");
    }

    auto user = tx.get_user(joiner.user_id);
    if (!user) {
      return Result<OrderRecord>(ErrorCode::NOT_FOUND,
                                 "User not found: " + joiner.user_id);
    }
    auto admitted = check_admission(user->value);
    if (admitted.is_err()) {
      return Result<OrderRecord>::from_error(admitted);
    }

    auto debited = tx.apply_balance_change(
        joiner.user_id, -order.total_stake(), TransactionType::STAKE_LOCK,
        order.id, std::nullopt, "Stake locked: joined order " + order.id);
    if (debited.is_err()) {
      return Result<OrderRecord>::from_error(debited);
    }

    const TimestampMs now = tx.now();
    order.status = OrderStatus::WAITING_CREATOR_CONFIRM;
    order.opponent_id = joiner.user_id;
    order.confirmation_deadline = now + config_.confirmation_timeout.count();
    order.updated_at = now;
    tx.put_order(order, current->generation);

    tx.on_commit([this, order]() {
      if (timeouts_) {
        timeouts_->schedule(scheduling::TimeoutKind::CONFIRMATION, order.id,
                            *order.confirmation_deadline);
      }
      notify(NotificationType::OPPONENT_FOUND, order.owner_id,
             "Opponent found. Confirm the duel before the deadline.", order);
      notify(NotificationType::CONFIRMATION_REQUIRED, *order.opponent_id,
             "Waiting for the order owner to confirm.", order);
    });
    return Result<OrderRecord>(order);
  });

  if (result.is_ok()) {
    LOG_INFO("matching", "Order ", order_id, " joined by ", joiner.user_id);
  }
  return result;
}

Result<ConfirmResult> OrderMatcher::confirm(const OrderId &order_id,
                                            const Caller &owner) {
  auto result = store_->transact([&](StoreTransaction &tx) {
    auto current = tx.get_order(order_id);
    if (!current) {
      return Result<ConfirmResult>(ErrorCode::NOT_FOUND,
                                   "Order not found: " + order_id);
    }
    OrderRecord order = current->value;
    if (order.owner_id != owner.user_id) {
      return Result<ConfirmResult>(ErrorCode::NOT_OWNER,
                                   "Only the order owner can confirm");
    }
    if (order.status != OrderStatus::WAITING_CREATOR_CONFIRM) {
      return Result<ConfirmResult>(
          ErrorCode::STATE_CONFLICT,
          "Order is not waiting for confirmation: " +
              std::string(storage::order_status_name(order.status)));
    }

    const TimestampMs now = tx.now();
    if (order.confirmation_deadline && now > *order.confirmation_deadline) {
      return Result<ConfirmResult>(ErrorCode::EXPIRED,
                                   "Confirmation window has expired");
    }

    MatchRecord match;
    match.id = tx.next_id("match");
    match.order_id = order.id;
    match.player_a_id = order.owner_id;
    match.player_b_id = *order.opponent_id;
    match.stake_per_game = order.stake_per_game;
    match.games_planned = order.games_planned;
    match.created_at = now;

    order.status = OrderStatus::MATCHED;
    order.match_id = match.id;
    order.confirmation_deadline.reset();
    order.updated_at = now;

    auto inserted = tx.insert_match(match);
    if (inserted.is_err()) {
      return Result<ConfirmResult>::from_error(inserted);
    }
    tx.put_order(order, current->generation);
    return Result<ConfirmResult>(ConfirmResult{order, match});
  });

  if (result.is_ok()) {
    LOG_INFO("matching", "Order ", order_id, " confirmed, match ",
             result.value().match.id);
  }
  return result;
}

Result<OrderRecord> OrderMatcher::cancel(const OrderId &order_id,
                                         const Caller &owner) {
  auto result = store_->transact([&](StoreTransaction &tx) {
    auto current = tx.get_order(order_id);
    if (!current) {
      return Result<OrderRecord>(ErrorCode::NOT_FOUND,
                                 "Order not found: " + order_id);
    }
    OrderRecord order = current->value;
    if (order.owner_id != owner.user_id) {
      return Result<OrderRecord>(ErrorCode::NOT_OWNER,
                                 "Only the order owner can cancel");
    }
    if (order.status != OrderStatus::OPEN) {
      return Result<OrderRecord>(ErrorCode::STATE_CONFLICT,
                                 "Only OPEN orders can be cancelled");
    }

    auto refunded = tx.apply_balance_change(
        order.owner_id, order.total_stake(), TransactionType::STAKE_REFUND,
        order.id, std::nullopt, "Stake refunded: order cancelled");
    if (refunded.is_err()) {
      return Result<OrderRecord>::from_error(refunded);
    }

    order.status = OrderStatus::CANCELLED;
    order.updated_at = tx.now();
    tx.put_order(order, current->generation);
    return Result<OrderRecord>(order);
  });

  if (result.is_ok()) {
    LOG_INFO("matching", "Order ", order_id, " cancelled");
  }
  return result;
}

Result<OrderRecord> OrderMatcher::expire_confirmation(const OrderId &order_id) {
  return store_->transact([&](StoreTransaction &tx) {
    auto current = tx.get_order(order_id);
    if (!current) {
      return Result<OrderRecord>(ErrorCode::NOT_FOUND,
                                 "Order not found: " + order_id);
    }
    OrderRecord order = current->value;
    const TimestampMs now = tx.now();
    if (order.status != OrderStatus::WAITING_CREATOR_CONFIRM ||
        !order.confirmation_deadline ||
        now <= *order.confirmation_deadline) {
      return Result<OrderRecord>(order);
    }

    const UserId joiner_id = *order.opponent_id;
    auto refunded = tx.apply_balance_change(
        joiner_id, order.total_stake(), TransactionType::STAKE_REFUND,
        order.id, std::nullopt, "Stake refunded: owner did not confirm");
    if (refunded.is_err()) {
      return Result<OrderRecord>::from_error(refunded);
    }

    auto owner = tx.get_user(order.owner_id);
    if (!owner) {
      return Result<OrderRecord>(ErrorCode::INTERNAL,
                                 "Order owner missing: " + order.owner_id);
    }
    UserRecord owner_record = owner->value;
    reliability::ReliabilityTracker::apply_event(
        owner_record.reliability,
        reliability::ReliabilityEvent::MISSED_CONFIRMATION);
    tx.put_user(owner_record);

    order.missed_confirmations += 1;
    order.opponent_id.reset();
    order.confirmation_deadline.reset();
    order.updated_at = now;

    if (order.missed_confirmations >= config_.max_missed_confirmations) {
      auto owner_refund = tx.apply_balance_change(
          order.owner_id, order.total_stake(), TransactionType::STAKE_REFUND,
          order.id, std::nullopt, "Stake refunded: order expired");
      if (owner_refund.is_err()) {
        return Result<OrderRecord>::from_error(owner_refund);
      }
      order.status = OrderStatus::EXPIRED;
    } else {
      order.status = OrderStatus::OPEN;
    }
    tx.put_order(order, current->generation);

    tx.on_commit([this, order, joiner_id]() {
      LOG_INFO("matching", "Confirmation expired for order ", order.id,
               ", now ", storage::order_status_name(order.status));
      notify(NotificationType::CONFIRMATION_EXPIRED, joiner_id,
             "The order owner did not confirm. Your stake was refunded.",
             order);
      notify(NotificationType::CONFIRMATION_EXPIRED, order.owner_id,
             "You missed a confirmation. Your reliability was reduced.",
             order);
    });
    return Result<OrderRecord>(order);
  });
}

std::optional<OrderRecord> OrderMatcher::get(const OrderId &order_id) const {
  auto order = store_->get_order(order_id);
  if (!order) {
    return std::nullopt;
  }
  return order->value;
}

namespace {

// Arena order is insertion order; reverse it so equal timestamps still
// come out newest first
std::vector<OrderRecord> newest_first(std::vector<OrderRecord> orders) {
  std::reverse(orders.begin(), orders.end());
  std::stable_sort(orders.begin(), orders.end(),
                   [](const OrderRecord &a, const OrderRecord &b) {
                     return a.created_at > b.created_at;
                   });
  return orders;
}

} // namespace

std::vector<OrderRecord> OrderMatcher::open_orders() const {
  return newest_first(store_->select_orders(
      [](const OrderRecord &order) { return order.status == OrderStatus::OPEN; }));
}

std::vector<OrderRecord>
OrderMatcher::orders_for_user(const UserId &user_id) const {
  return newest_first(store_->select_orders([&](const OrderRecord &order) {
    return order.owner_id == user_id ||
           (order.opponent_id && *order.opponent_id == user_id);
  }));
}

} // namespace matching
} // namespace fairduel
