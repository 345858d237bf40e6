#pragma once

#include "storage/records.h"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fairduel {
namespace storage {

/**
 * @brief Contiguous record storage with an id index
 *
 * Records are never removed; every overwrite bumps the slot generation so
 * that a writer holding an older generation can be detected as stale.
 * Not thread-safe; DuelStore serialises access.
 */
template <typename T> class Arena {
public:
  struct Slot {
    T value;
    uint64_t generation = 0;
  };

  std::optional<Versioned<T>> find(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
      return std::nullopt;
    }
    const Slot &slot = slots_[it->second];
    return Versioned<T>{slot.value, slot.generation};
  }

  bool contains(const std::string &id) const { return index_.count(id) > 0; }

  std::optional<uint64_t> generation_of(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
      return std::nullopt;
    }
    return slots_[it->second].generation;
  }

  /// @return the new generation of the slot
  uint64_t upsert(const std::string &id, T value) {
    auto it = index_.find(id);
    if (it != index_.end()) {
      Slot &slot = slots_[it->second];
      slot.value = std::move(value);
      return ++slot.generation;
    }
    index_.emplace(id, slots_.size());
    slots_.push_back(Slot{std::move(value), 1});
    return 1;
  }

  template <typename F> void for_each(F &&fn) const {
    for (const auto &slot : slots_) {
      fn(slot.value);
    }
  }

  size_t size() const { return slots_.size(); }

private:
  std::vector<Slot> slots_;
  std::unordered_map<std::string, size_t> index_;
};

} // namespace storage
} // namespace fairduel
