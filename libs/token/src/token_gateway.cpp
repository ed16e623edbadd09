#include "lendcore/token/token_gateway.hpp"

#include <string>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace token {

void InMemoryTokenGateway::mint(common::AssetKind asset, common::AccountId account, std::int64_t amount) {
  if (amount <= 0) {
    throw common::LendingError(common::ErrorCode::kInvalidInput, "mint amount must be positive");
  }
  auto& wallet = balances(asset).wallets[account];
  wallet = common::checked_add(wallet, amount);
}

void InMemoryTokenGateway::transfer_in(common::AssetKind asset, common::AccountId from, std::int64_t amount) {
  auto& book = balances(asset);
  auto it = book.wallets.find(from);
  const std::int64_t available = it == book.wallets.end() ? 0 : it->second;
  if (amount <= 0 || available < amount) {
    throw common::LendingError(common::ErrorCode::kTransferFailed,
                               std::string(common::to_string(asset)) + " wallet of " + std::to_string(from) +
                                   " holds " + std::to_string(available) + ", needs " + std::to_string(amount));
  }
  const std::int64_t custody = common::checked_add(book.custody, amount);
  it->second -= amount;
  book.custody = custody;
}

void InMemoryTokenGateway::transfer_out(common::AssetKind asset, common::AccountId to, std::int64_t amount) {
  auto& book = balances(asset);
  if (amount <= 0 || book.custody < amount) {
    throw common::LendingError(common::ErrorCode::kTransferFailed,
                               std::string(common::to_string(asset)) + " custody holds " +
                                   std::to_string(book.custody) + ", needs " + std::to_string(amount));
  }
  auto& wallet = book.wallets[to];
  wallet = common::checked_add(wallet, amount);
  book.custody -= amount;
}

std::int64_t InMemoryTokenGateway::wallet(common::AssetKind asset, common::AccountId account) const {
  const auto& book = balances(asset);
  if (auto it = book.wallets.find(account); it != book.wallets.end()) {
    return it->second;
  }
  return 0;
}

std::int64_t InMemoryTokenGateway::custody(common::AssetKind asset) const {
  return balances(asset).custody;
}

InMemoryTokenGateway::Balances& InMemoryTokenGateway::balances(common::AssetKind asset) {
  return asset == common::AssetKind::kLendable ? lendable_ : collateral_;
}

const InMemoryTokenGateway::Balances& InMemoryTokenGateway::balances(common::AssetKind asset) const {
  return asset == common::AssetKind::kLendable ? lendable_ : collateral_;
}

}  // namespace token
}  // namespace lendcore
