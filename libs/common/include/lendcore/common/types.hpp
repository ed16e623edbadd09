#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lendcore {
namespace common {

using AccountId = std::uint64_t;
using TimestampSec = std::uint64_t;
using SequenceId = std::uint64_t;

enum class AssetKind : std::uint8_t {
  kLendable,
  kCollateral,
};

inline constexpr std::string_view to_string(AssetKind kind) noexcept {
  return kind == AssetKind::kLendable ? "lendable" : "collateral";
}

// Symbols travel with a one-byte length prefix in journal and snapshot records.
inline constexpr std::size_t kMaxAssetSymbolLength = 15;

}  // namespace common
}  // namespace lendcore
