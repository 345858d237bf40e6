#pragma once

#include "common/clock.h"
#include "common/logging.h"
#include "common/types.h"
#include "storage/arena.h"
#include "storage/records.h"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fairduel {
namespace storage {

class DuelStore;

/**
 * @brief Staged write set of one store transaction
 *
 * Reads see the transaction's own writes first, then the committed state.
 * Nothing reaches the store until DuelStore::transact() commits; a failed
 * transaction is simply dropped.
 */
class StoreTransaction {
public:
  explicit StoreTransaction(DuelStore &store);

  std::optional<Versioned<UserRecord>> get_user(const UserId &id) const;
  std::optional<Versioned<OrderRecord>> get_order(const OrderId &id) const;
  std::optional<Versioned<MatchRecord>> get_match(const MatchId &id) const;
  std::optional<Versioned<GameRecord>> get_game(const GameId &id) const;

  /// Fails with STATE_CONFLICT if the id is already taken
  Result<bool> insert_user(UserRecord record);
  Result<bool> insert_order(OrderRecord record);
  Result<bool> insert_match(MatchRecord record);
  Result<bool> insert_game(GameRecord record);

  /**
   * @brief Stage an update
   * @param expected_generation when set, commit fails with STATE_CONFLICT
   * unless the committed slot still has this generation
   */
  void put_user(UserRecord record,
                std::optional<uint64_t> expected_generation = std::nullopt);
  void put_order(OrderRecord record,
                 std::optional<uint64_t> expected_generation = std::nullopt);
  void put_match(MatchRecord record,
                 std::optional<uint64_t> expected_generation = std::nullopt);
  void put_game(GameRecord record,
                std::optional<uint64_t> expected_generation = std::nullopt);

  /**
   * @brief Change a balance and append the matching ledger entry
   *
   * The only way balances move. Rejects overdrafts with
   * INSUFFICIENT_BALANCE without staging anything.
   *
   * @return the new balance
   */
  Result<Points> apply_balance_change(const UserId &user_id, Points amount,
                                      TransactionType type,
                                      const std::optional<OrderId> &order_id,
                                      const std::optional<MatchId> &match_id,
                                      const std::string &description);

  /// Run after a successful commit, outside the store lock
  void on_commit(std::function<void()> hook);

  std::string next_id(const std::string &prefix);
  TimestampMs now() const;

private:
  friend class DuelStore;

  template <typename T> struct Staged {
    T value;
    uint64_t base_generation = 0;
    std::optional<uint64_t> expected_generation;
    bool is_insert = false;
  };

  template <typename T>
  using StagedMap = std::unordered_map<std::string, Staged<T>>;

  Result<bool> commit();
  std::vector<std::function<void()>> take_commit_hooks() {
    return std::move(commit_hooks_);
  }

  DuelStore &store_;
  StagedMap<UserRecord> users_;
  StagedMap<OrderRecord> orders_;
  StagedMap<MatchRecord> matches_;
  StagedMap<GameRecord> games_;
  std::vector<LedgerEntry> ledger_;
  std::vector<std::function<void()>> commit_hooks_;
};

/**
 * @brief Transactional in-memory repository for users, orders, matches,
 * games and the ledger
 *
 * One arena per entity plus an append-only ledger. transact() runs a
 * function against a StoreTransaction under an exclusive lock, so every
 * transaction is serialisable against every other; snapshot reads take a
 * shared lock.
 */
class DuelStore {
public:
  explicit DuelStore(std::shared_ptr<Clock> clock);

  /**
   * @brief Execute fn atomically
   *
   * fn returns a Result<T>. An error result (or an exception) discards the
   * whole write set; a successful one is committed, then the transaction's
   * commit hooks run after the lock is released.
   */
  template <typename F>
  auto transact(F &&fn) -> decltype(fn(std::declval<StoreTransaction &>()));

  std::optional<Versioned<UserRecord>> get_user(const UserId &id) const;
  std::optional<Versioned<OrderRecord>> get_order(const OrderId &id) const;
  std::optional<Versioned<MatchRecord>> get_match(const MatchId &id) const;
  std::optional<Versioned<GameRecord>> get_game(const GameId &id) const;

  std::vector<UserRecord>
  select_users(const std::function<bool(const UserRecord &)> &pred) const;
  std::vector<OrderRecord>
  select_orders(const std::function<bool(const OrderRecord &)> &pred) const;
  std::vector<MatchRecord>
  select_matches(const std::function<bool(const MatchRecord &)> &pred) const;
  std::vector<GameRecord>
  select_games(const std::function<bool(const GameRecord &)> &pred) const;
  std::vector<LedgerEntry>
  select_ledger(const std::function<bool(const LedgerEntry &)> &pred) const;

  /// Signed sum of all ledger entries tied to an order; 0 once settled
  Points order_ledger_balance(const OrderId &order_id) const;
  size_t ledger_size() const;

  std::string next_id(const std::string &prefix);
  TimestampMs now() const { return clock_->now_ms(); }

private:
  friend class StoreTransaction;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<Clock> clock_;
  std::atomic<uint64_t> id_counter_{0};

  Arena<UserRecord> users_;
  Arena<OrderRecord> orders_;
  Arena<MatchRecord> matches_;
  Arena<GameRecord> games_;
  std::vector<LedgerEntry> ledger_;
};

template <typename F>
auto DuelStore::transact(F &&fn)
    -> decltype(fn(std::declval<StoreTransaction &>())) {
  using R = decltype(fn(std::declval<StoreTransaction &>()));

  std::vector<std::function<void()>> hooks;
  R result(ErrorCode::INTERNAL, "transaction not executed");
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    StoreTransaction tx(*this);

    try {
      result = fn(tx);
    } catch (const std::exception &e) {
      LOG_STORE_ERROR("Transaction aborted by exception", "TX_EXCEPTION",
                      {{"what", e.what()}});
      return R(ErrorCode::INTERNAL, std::string("Transaction failed: ") +
                                        e.what());
    }

    if (result.is_err()) {
      LOG_DEBUG("store", "Transaction rolled back: ", result.error());
      return result;
    }

    auto committed = tx.commit();
    if (committed.is_err()) {
      return R::from_error(committed);
    }
    hooks = tx.take_commit_hooks();
  }

  for (auto &hook : hooks) {
    try {
      hook();
    } catch (const std::exception &e) {
      LOG_ERROR("store", "Commit hook failed: ", e.what());
    }
  }
  return result;
}

} // namespace storage
} // namespace fairduel
