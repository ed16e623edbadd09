#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// Registry of the public key each principal signs with.
class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  void register_principal(common::AccountId principal, const PublicKey& public_key);
  void unregister_principal(common::AccountId principal);
  bool has_principal(common::AccountId principal) const;
  std::optional<PublicKey> public_key(common::AccountId principal) const;
  std::size_t principal_count() const;

  // Verify a signature against a message using the principal's registered key
  bool verify(common::AccountId principal,
              std::span<const std::byte> message,
              const Signature& signature) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  // Client side helpers
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

  // Parses 64 lowercase or uppercase hex characters.
  static std::optional<PublicKey> parse_public_key(std::string_view hex);

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::AccountId, PublicKey> keys_;
};

}  // namespace auth
}  // namespace lendcore
