#include "lendcore/auth/authorizer.hpp"

#include <stdexcept>
#include <string>

#include "lendcore/common/error.hpp"

namespace lendcore {
namespace auth {

namespace {

void append_u64(std::vector<std::byte>& out, std::uint64_t value) {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

}  // namespace

std::vector<std::byte> encode_action(const Action& action,
                                     common::AccountId principal,
                                     std::uint64_t nonce) {
  std::vector<std::byte> message;
  message.reserve(1 + 8 * 4 + 1 + action.asset.size());
  message.push_back(static_cast<std::byte>(action.kind));
  append_u64(message, principal);
  append_u64(message, action.subject);
  append_u64(message, static_cast<std::uint64_t>(action.amount));
  append_u64(message, nonce);
  message.push_back(static_cast<std::byte>(action.asset.size() & 0xff));
  for (const char c : action.asset) {
    message.push_back(static_cast<std::byte>(c));
  }
  return message;
}

SignatureAuthorizer::SignatureAuthorizer(const Authenticator& keys) : keys_(keys) {}

void SignatureAuthorizer::require(const Credential& credential,
                                  common::AccountId principal,
                                  const Action& action) {
  if (credential.principal != principal) {
    throw common::LendingError(common::ErrorCode::kUnauthorized,
                               "caller " + std::to_string(credential.principal) +
                                   " is not principal " + std::to_string(principal));
  }

  const std::uint64_t last = last_nonce(principal);
  if (credential.nonce <= last) {
    throw common::LendingError(common::ErrorCode::kUnauthorized,
                               "nonce " + std::to_string(credential.nonce) + " already used");
  }

  const auto message = encode_action(action, principal, credential.nonce);
  if (!keys_.verify(principal, message, credential.signature)) {
    throw common::LendingError(common::ErrorCode::kUnauthorized,
                               "bad signature for principal " + std::to_string(principal));
  }

  last_nonce_[principal] = credential.nonce;
}

std::uint64_t SignatureAuthorizer::last_nonce(common::AccountId principal) const {
  if (auto it = last_nonce_.find(principal); it != last_nonce_.end()) {
    return it->second;
  }
  return 0;
}

Signer::Signer(common::AccountId principal, const SecretKey& secret_key, std::uint64_t next_nonce)
    : principal_(principal), secret_key_(secret_key), next_nonce_(next_nonce) {}

Signer Signer::generate(common::AccountId principal, PublicKey& out_public) {
  SecretKey secret{};
  Authenticator::generate_keypair(out_public, secret);
  return Signer{principal, secret};
}

Credential Signer::sign(const Action& action) {
  Credential credential{.principal = principal_, .nonce = next_nonce_++, .signature = {}};
  const auto message = encode_action(action, principal_, credential.nonce);
  if (!Authenticator::sign(secret_key_, message, credential.signature)) {
    throw std::runtime_error("failed to sign action");
  }
  return credential;
}

}  // namespace auth
}  // namespace lendcore
