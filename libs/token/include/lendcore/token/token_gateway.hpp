#pragma once

#include <cstdint>
#include <unordered_map>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace token {

// Moves real assets between a participant and the pool's custody. Either the
// whole transfer happens or the call throws and the invocation aborts.
class TokenGateway {
 public:
  virtual ~TokenGateway() = default;

  virtual void transfer_in(common::AssetKind asset, common::AccountId from, std::int64_t amount) = 0;
  virtual void transfer_out(common::AssetKind asset, common::AccountId to, std::int64_t amount) = 0;
};

// Wallet balances per participant plus the pool's custody, per asset kind.
class InMemoryTokenGateway final : public TokenGateway {
 public:
  void mint(common::AssetKind asset, common::AccountId account, std::int64_t amount);

  void transfer_in(common::AssetKind asset, common::AccountId from, std::int64_t amount) override;
  void transfer_out(common::AssetKind asset, common::AccountId to, std::int64_t amount) override;

  [[nodiscard]] std::int64_t wallet(common::AssetKind asset, common::AccountId account) const;
  [[nodiscard]] std::int64_t custody(common::AssetKind asset) const;

 private:
  struct Balances {
    std::unordered_map<common::AccountId, std::int64_t> wallets{};
    std::int64_t custody{0};
  };

  Balances& balances(common::AssetKind asset);
  const Balances& balances(common::AssetKind asset) const;

  Balances lendable_{};
  Balances collateral_{};
};

}  // namespace token
}  // namespace lendcore
