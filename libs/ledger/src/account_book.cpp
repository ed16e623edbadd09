#include "lendcore/ledger/account_book.hpp"

#include <algorithm>

namespace lendcore {
namespace ledger {

namespace {

std::int64_t settle(std::int64_t principal, std::int64_t index, std::int64_t snapshot) {
  if (principal == 0) {
    return 0;
  }
  return common::mul_div(principal, index, snapshot);
}

}  // namespace

std::int64_t deposit_balance(const AccountRecord& record, const PoolState& pool) {
  if (record.supply_epoch != pool.supply_epoch) {
    return 0;
  }
  return settle(record.deposit_principal, pool.supply_index, record.supply_index_snapshot);
}

std::int64_t borrow_balance(const AccountRecord& record, const PoolState& pool) {
  return settle(record.borrow_principal, pool.borrow_index, record.borrow_index_snapshot);
}

AccountRecord AccountBook::get(common::AccountId account) const {
  if (auto it = accounts_.find(account); it != accounts_.end()) {
    return it->second;
  }
  return {};
}

void AccountBook::put(common::AccountId account, const AccountRecord& record) {
  if (prune_empty_ && record.empty()) {
    accounts_.erase(account);
    return;
  }
  accounts_.insert_or_assign(account, record);
}

bool AccountBook::contains(common::AccountId account) const {
  return accounts_.find(account) != accounts_.end();
}

std::vector<common::AccountId> AccountBook::accounts() const {
  std::vector<common::AccountId> ids;
  ids.reserve(accounts_.size());
  for (const auto& [id, record] : accounts_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace ledger
}  // namespace lendcore
