#pragma once

#include <cstdint>
#include <limits>

#include "lendcore/common/error.hpp"

namespace lendcore {
namespace common {

// 128-bit intermediate for every product of two scaled quantities.
using Wide = __int128;

inline constexpr std::int64_t kRateScale = 10'000'000;        // 1.0 == 100%
inline constexpr std::int64_t kPriceScale = 10'000'000;       // 1.0 USD
inline constexpr std::int64_t kIndexScale = 1'000'000'000;    // index 1.0
inline constexpr std::int64_t kBasisPointDenominator = 10'000;
inline constexpr std::int64_t kSecondsPerYear = 31'536'000;

inline std::int64_t narrow(Wide value) {
  if (value > static_cast<Wide>(std::numeric_limits<std::int64_t>::max()) ||
      value < static_cast<Wide>(std::numeric_limits<std::int64_t>::min())) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "value does not fit in 64 bits");
  }
  return static_cast<std::int64_t>(value);
}

// a * b / denominator, truncating toward zero.
inline std::int64_t mul_div(std::int64_t a, std::int64_t b, std::int64_t denominator) {
  if (denominator == 0) {
    throw LendingError(ErrorCode::kInvalidInput, "division by zero");
  }
  return narrow(static_cast<Wide>(a) * b / denominator);
}

inline Wide checked_mul(Wide a, Wide b) {
  Wide product = 0;
  if (__builtin_mul_overflow(a, b, &product)) {
    throw LendingError(ErrorCode::kArithmeticOverflow, "128-bit product overflow");
  }
  return product;
}

inline std::int64_t checked_add(std::int64_t a, std::int64_t b) {
  return narrow(static_cast<Wide>(a) + b);
}

inline std::int64_t checked_sub(std::int64_t a, std::int64_t b) {
  return narrow(static_cast<Wide>(a) - b);
}

inline std::int64_t asset_to_usd(std::int64_t amount, std::int64_t price) {
  return mul_div(amount, price, kPriceScale);
}

inline std::int64_t usd_to_asset(std::int64_t usd, std::int64_t price) {
  if (price == 0) {
    throw LendingError(ErrorCode::kPriceNotSet, "cannot convert with a zero price");
  }
  return mul_div(usd, kPriceScale, price);
}

}  // namespace common
}  // namespace lendcore
