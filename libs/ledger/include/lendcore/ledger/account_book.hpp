#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "lendcore/common/fixed_point.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/ledger/pool_state.hpp"

namespace lendcore {
namespace ledger {

// Interest-bearing balances are principals tagged with the index they were
// last settled at; the live balance is principal * index / snapshot. A
// deposit settled in an earlier supply epoch than the pool's is worth zero.
struct AccountRecord {
  std::int64_t deposit_principal{0};
  std::int64_t supply_index_snapshot{common::kIndexScale};
  std::int64_t borrow_principal{0};
  std::int64_t borrow_index_snapshot{common::kIndexScale};
  std::int64_t collateral{0};
  std::uint64_t supply_epoch{0};

  [[nodiscard]] bool empty() const noexcept {
    return deposit_principal == 0 && borrow_principal == 0 && collateral == 0;
  }

  friend bool operator==(const AccountRecord&, const AccountRecord&) = default;
};

[[nodiscard]] std::int64_t deposit_balance(const AccountRecord& record, const PoolState& pool);
[[nodiscard]] std::int64_t borrow_balance(const AccountRecord& record, const PoolState& pool);

class AccountBook {
 public:
  explicit AccountBook(bool prune_empty = true) : prune_empty_(prune_empty) {}

  // Zero-valued record for accounts never seen.
  [[nodiscard]] AccountRecord get(common::AccountId account) const;
  void put(common::AccountId account, const AccountRecord& record);
  [[nodiscard]] bool contains(common::AccountId account) const;

  [[nodiscard]] std::size_t size() const noexcept { return accounts_.size(); }
  [[nodiscard]] std::vector<common::AccountId> accounts() const;
  [[nodiscard]] const std::unordered_map<common::AccountId, AccountRecord>& records() const noexcept {
    return accounts_;
  }

  void set_prune_empty(bool prune_empty) noexcept { prune_empty_ = prune_empty; }
  void clear() noexcept { accounts_.clear(); }

 private:
  std::unordered_map<common::AccountId, AccountRecord> accounts_{};
  bool prune_empty_;
};

}  // namespace ledger
}  // namespace lendcore
