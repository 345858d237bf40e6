#include "storage/duel_store.h"
#include <algorithm>
#include <iterator>

namespace fairduel {
namespace storage {

const char *order_status_name(OrderStatus status) noexcept {
  switch (status) {
  case OrderStatus::OPEN:
    return "OPEN";
  case OrderStatus::WAITING_CREATOR_CONFIRM:
    return "WAITING_CREATOR_CONFIRM";
  case OrderStatus::MATCHED:
    return "MATCHED";
  case OrderStatus::IN_PROGRESS:
    return "IN_PROGRESS";
  case OrderStatus::COMPLETED:
    return "COMPLETED";
  case OrderStatus::CANCELLED:
    return "CANCELLED";
  case OrderStatus::EXPIRED:
    return "EXPIRED";
  }
  return "UNKNOWN";
}

const char *match_status_name(MatchStatus status) noexcept {
  switch (status) {
  case MatchStatus::IN_PROGRESS:
    return "IN_PROGRESS";
  case MatchStatus::COMPLETED:
    return "COMPLETED";
  case MatchStatus::FORFEITED:
    return "FORFEITED";
  case MatchStatus::BOTH_ABANDONED:
    return "BOTH_ABANDONED";
  }
  return "UNKNOWN";
}

const char *game_status_name(GameStatus status) noexcept {
  return status == GameStatus::FINISHED ? "FINISHED" : "AWAITING_NUMBERS";
}

const char *game_outcome_name(GameOutcome outcome) noexcept {
  switch (outcome) {
  case GameOutcome::PENDING:
    return "PENDING";
  case GameOutcome::A_WINS:
    return "A_WINS";
  case GameOutcome::B_WINS:
    return "B_WINS";
  case GameOutcome::DRAW:
    return "DRAW";
  case GameOutcome::FORFEITED_A:
    return "FORFEITED_A";
  case GameOutcome::FORFEITED_B:
    return "FORFEITED_B";
  case GameOutcome::ABANDONED:
    return "ABANDONED";
  }
  return "UNKNOWN";
}

namespace {

template <typename T, typename Map>
std::optional<Versioned<T>> staged_or_committed(const Map &staged,
                                                const Arena<T> &arena,
                                                const std::string &id) {
  auto it = staged.find(id);
  if (it != staged.end()) {
    return Versioned<T>{it->second.value, it->second.base_generation};
  }
  return arena.find(id);
}

template <typename Map, typename T>
Result<bool> stage_insert(Map &staged, const Arena<T> &arena, T record,
                          const char *kind) {
  const std::string id = record.id;
  if (id.empty()) {
    return Result<bool>(ErrorCode::VALIDATION,
                        std::string(kind) + " id must not be empty");
  }
  if (arena.contains(id) || staged.count(id) > 0) {
    return Result<bool>(ErrorCode::STATE_CONFLICT,
                        std::string(kind) + " already exists: " + id);
  }
  auto &entry = staged[id];
  entry.value = std::move(record);
  entry.base_generation = 0;
  entry.is_insert = true;
  return Result<bool>(true);
}

template <typename Map, typename T>
void stage_put(Map &staged, const Arena<T> &arena, T record,
               std::optional<uint64_t> expected_generation) {
  const std::string id = record.id;
  auto it = staged.find(id);
  if (it != staged.end()) {
    it->second.value = std::move(record);
    if (expected_generation && !it->second.expected_generation) {
      it->second.expected_generation = expected_generation;
    }
    return;
  }
  auto &entry = staged[id];
  entry.value = std::move(record);
  entry.base_generation = arena.generation_of(id).value_or(0);
  entry.expected_generation = expected_generation;
}

template <typename Map, typename T>
Result<bool> check_staged(const Map &staged, const Arena<T> &arena,
                          const char *kind) {
  for (const auto &item : staged) {
    const auto current = arena.generation_of(item.first);
    if (item.second.is_insert) {
      if (current) {
        return Result<bool>(ErrorCode::STATE_CONFLICT,
                            std::string(kind) + " already exists: " +
                                item.first);
      }
      continue;
    }
    if (item.second.expected_generation &&
        current.value_or(0) != *item.second.expected_generation) {
      return Result<bool>(ErrorCode::STATE_CONFLICT,
                          std::string(kind) + " " + item.first +
                              " was modified concurrently");
    }
  }
  return Result<bool>(true);
}

template <typename Map, typename T> void apply_staged(Map &staged, Arena<T> &arena) {
  for (auto &item : staged) {
    arena.upsert(item.first, std::move(item.second.value));
  }
  staged.clear();
}

template <typename T, typename Pred>
std::vector<T> collect(const Arena<T> &arena, const Pred &pred) {
  std::vector<T> out;
  arena.for_each([&](const T &value) {
    if (pred(value)) {
      out.push_back(value);
    }
  });
  return out;
}

} // namespace

// StoreTransaction

StoreTransaction::StoreTransaction(DuelStore &store) : store_(store) {}

std::optional<Versioned<UserRecord>>
StoreTransaction::get_user(const UserId &id) const {
  return staged_or_committed(users_, store_.users_, id);
}

std::optional<Versioned<OrderRecord>>
StoreTransaction::get_order(const OrderId &id) const {
  return staged_or_committed(orders_, store_.orders_, id);
}

std::optional<Versioned<MatchRecord>>
StoreTransaction::get_match(const MatchId &id) const {
  return staged_or_committed(matches_, store_.matches_, id);
}

std::optional<Versioned<GameRecord>>
StoreTransaction::get_game(const GameId &id) const {
  return staged_or_committed(games_, store_.games_, id);
}

Result<bool> StoreTransaction::insert_user(UserRecord record) {
  return stage_insert(users_, store_.users_, std::move(record), "User");
}

Result<bool> StoreTransaction::insert_order(OrderRecord record) {
  return stage_insert(orders_, store_.orders_, std::move(record), "Order");
}

Result<bool> StoreTransaction::insert_match(MatchRecord record) {
  return stage_insert(matches_, store_.matches_, std::move(record), "Match");
}

Result<bool> StoreTransaction::insert_game(GameRecord record) {
  return stage_insert(games_, store_.games_, std::move(record), "Game");
}

void StoreTransaction::put_user(UserRecord record,
                                std::optional<uint64_t> expected_generation) {
  stage_put(users_, store_.users_, std::move(record), expected_generation);
}

void StoreTransaction::put_order(OrderRecord record,
                                 std::optional<uint64_t> expected_generation) {
  stage_put(orders_, store_.orders_, std::move(record), expected_generation);
}

void StoreTransaction::put_match(MatchRecord record,
                                 std::optional<uint64_t> expected_generation) {
  stage_put(matches_, store_.matches_, std::move(record), expected_generation);
}

void StoreTransaction::put_game(GameRecord record,
                                std::optional<uint64_t> expected_generation) {
  stage_put(games_, store_.games_, std::move(record), expected_generation);
}

Result<Points> StoreTransaction::apply_balance_change(
    const UserId &user_id, Points amount, TransactionType type,
    const std::optional<OrderId> &order_id,
    const std::optional<MatchId> &match_id, const std::string &description) {
  auto user = get_user(user_id);
  if (!user) {
    return Result<Points>(ErrorCode::NOT_FOUND, "User not found: " + user_id);
  }

  UserRecord updated = user->value;
  if (updated.points_balance + amount < 0) {
    return Result<Points>(ErrorCode::INSUFFICIENT_BALANCE,
                          "Insufficient balance: have " +
                              std::to_string(updated.points_balance) +
                              ", need " + std::to_string(-amount));
  }
  updated.points_balance += amount;
  const Points new_balance = updated.points_balance;
  put_user(std::move(updated));

  LedgerEntry entry;
  entry.id = next_id("tx");
  entry.user_id = user_id;
  entry.type = type;
  entry.amount = amount;
  entry.related_order_id = order_id;
  entry.related_match_id = match_id;
  entry.description = description;
  entry.created_at = now();
  ledger_.push_back(std::move(entry));

  return Result<Points>(new_balance);
}

void StoreTransaction::on_commit(std::function<void()> hook) {
  commit_hooks_.push_back(std::move(hook));
}

std::string StoreTransaction::next_id(const std::string &prefix) {
  return store_.next_id(prefix);
}

TimestampMs StoreTransaction::now() const { return store_.now(); }

Result<bool> StoreTransaction::commit() {
  // Validate everything before touching the arenas so a conflict leaves
  // the store unchanged
  auto checked = check_staged(users_, store_.users_, "User");
  if (checked.is_err())
    return checked;
  checked = check_staged(orders_, store_.orders_, "Order");
  if (checked.is_err())
    return checked;
  checked = check_staged(matches_, store_.matches_, "Match");
  if (checked.is_err())
    return checked;
  checked = check_staged(games_, store_.games_, "Game");
  if (checked.is_err())
    return checked;

  apply_staged(users_, store_.users_);
  apply_staged(orders_, store_.orders_);
  apply_staged(matches_, store_.matches_);
  apply_staged(games_, store_.games_);

  for (auto &entry : ledger_) {
    store_.ledger_.push_back(std::move(entry));
  }
  ledger_.clear();
  return Result<bool>(true);
}

// DuelStore

DuelStore::DuelStore(std::shared_ptr<Clock> clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }
}

std::optional<Versioned<UserRecord>>
DuelStore::get_user(const UserId &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return users_.find(id);
}

std::optional<Versioned<OrderRecord>>
DuelStore::get_order(const OrderId &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return orders_.find(id);
}

std::optional<Versioned<MatchRecord>>
DuelStore::get_match(const MatchId &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return matches_.find(id);
}

std::optional<Versioned<GameRecord>>
DuelStore::get_game(const GameId &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return games_.find(id);
}

std::vector<UserRecord> DuelStore::select_users(
    const std::function<bool(const UserRecord &)> &pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return collect(users_, pred);
}

std::vector<OrderRecord> DuelStore::select_orders(
    const std::function<bool(const OrderRecord &)> &pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return collect(orders_, pred);
}

std::vector<MatchRecord> DuelStore::select_matches(
    const std::function<bool(const MatchRecord &)> &pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return collect(matches_, pred);
}

std::vector<GameRecord> DuelStore::select_games(
    const std::function<bool(const GameRecord &)> &pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return collect(games_, pred);
}

std::vector<LedgerEntry> DuelStore::select_ledger(
    const std::function<bool(const LedgerEntry &)> &pred) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LedgerEntry> out;
  std::copy_if(ledger_.begin(), ledger_.end(), std::back_inserter(out), pred);
  return out;
}

Points DuelStore::order_ledger_balance(const OrderId &order_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  Points sum = 0;
  for (const auto &entry : ledger_) {
    if (entry.related_order_id && *entry.related_order_id == order_id) {
      sum += entry.amount;
    }
  }
  return sum;
}

size_t DuelStore::ledger_size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ledger_.size();
}

std::string DuelStore::next_id(const std::string &prefix) {
  const uint64_t n = id_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  return prefix + "_" + std::to_string(n);
}

} // namespace storage
} // namespace fairduel
