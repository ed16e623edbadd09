#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

enum class ActionKind : std::uint8_t {
  kDeposit = 1,
  kWithdraw,
  kDepositCollateral,
  kWithdrawCollateral,
  kBorrow,
  kRepay,
  kLiquidate,
  kSetPrice,
  kSetPriceChaos,
  kSetStalenessThreshold,
  kSetAdmin,
  kSetRiskParameters,
};

// What a principal is asking to do. `subject` is the account acted upon
// (the caller itself, a liquidated borrower, or a new admin).
struct Action {
  ActionKind kind{ActionKind::kDeposit};
  common::AccountId subject{0};
  std::int64_t amount{0};
  std::string_view asset{};
};

struct Credential {
  common::AccountId principal{0};
  std::uint64_t nonce{0};
  Signature signature{};
};

// Canonical signed message:
// [kind:1][principal:8][subject:8][amount:8][nonce:8][asset_len:1][asset:N]
// Integers are little-endian.
std::vector<std::byte> encode_action(const Action& action,
                                     common::AccountId principal,
                                     std::uint64_t nonce);

class Authorizer {
 public:
  virtual ~Authorizer() = default;

  // Throws LendingError(kUnauthorized) unless `credential` proves that
  // `principal` requested `action`.
  virtual void require(const Credential& credential,
                       common::AccountId principal,
                       const Action& action) = 0;
};

// ed25519 signatures over encode_action() with strictly increasing nonces
// per principal. A verified nonce is consumed even if the caller later
// aborts, so a rejected request cannot be replayed.
class SignatureAuthorizer final : public Authorizer {
 public:
  explicit SignatureAuthorizer(const Authenticator& keys);

  void require(const Credential& credential,
               common::AccountId principal,
               const Action& action) override;

  [[nodiscard]] std::uint64_t last_nonce(common::AccountId principal) const;

 private:
  const Authenticator& keys_;
  std::unordered_map<common::AccountId, std::uint64_t> last_nonce_{};
};

// Client side: holds a principal's secret key and produces credentials with
// increasing nonces.
class Signer {
 public:
  Signer(common::AccountId principal, const SecretKey& secret_key, std::uint64_t next_nonce = 1);

  static Signer generate(common::AccountId principal, PublicKey& out_public);

  [[nodiscard]] Credential sign(const Action& action);
  [[nodiscard]] common::AccountId principal() const noexcept { return principal_; }
  [[nodiscard]] std::uint64_t next_nonce() const noexcept { return next_nonce_; }

 private:
  common::AccountId principal_;
  SecretKey secret_key_;
  std::uint64_t next_nonce_;
};

}  // namespace auth
}  // namespace lendcore
