#include "lendcore/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace lendcore {
namespace auth {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

void Authenticator::register_principal(common::AccountId principal, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[principal] = public_key;
}

void Authenticator::unregister_principal(common::AccountId principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(principal);
}

bool Authenticator::has_principal(common::AccountId principal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.find(principal) != keys_.end();
}

std::optional<PublicKey> Authenticator::public_key(common::AccountId principal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(principal);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t Authenticator::principal_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

bool Authenticator::verify(common::AccountId principal,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const auto key = public_key(principal);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

std::optional<PublicKey> Authenticator::parse_public_key(std::string_view hex) {
  if (hex.size() != kPublicKeySize * 2) {
    return std::nullopt;
  }
  PublicKey key{};
  for (std::size_t i = 0; i < kPublicKeySize; ++i) {
    const int hi = hex_value(hex[2 * i]);
    const int lo = hex_value(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    key[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return key;
}

}  // namespace auth
}  // namespace lendcore
