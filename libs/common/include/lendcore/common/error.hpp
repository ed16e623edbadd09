#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lendcore {
namespace common {

enum class ErrorCode : std::uint16_t {
  kAlreadyInitialized = 3001,
  kNotInitialized = 3002,
  kInvalidInput = 3003,
  kUnauthorized = 3004,
  kInsufficientBalance = 3005,
  kInsufficientLiquidity = 3006,
  kExceedsCapacity = 3007,
  kUnhealthyPosition = 3008,
  kNoOutstandingDebt = 3009,
  kPriceNotSet = 3010,
  kStalePrice = 3011,
  kPositionHealthy = 3012,
  kArithmeticOverflow = 3013,
  kTransferFailed = 3014,
};

inline constexpr std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kAlreadyInitialized:
      return "AlreadyInitialized";
    case ErrorCode::kNotInitialized:
      return "NotInitialized";
    case ErrorCode::kInvalidInput:
      return "InvalidInput";
    case ErrorCode::kUnauthorized:
      return "Unauthorized";
    case ErrorCode::kInsufficientBalance:
      return "InsufficientBalance";
    case ErrorCode::kInsufficientLiquidity:
      return "InsufficientLiquidity";
    case ErrorCode::kExceedsCapacity:
      return "ExceedsCapacity";
    case ErrorCode::kUnhealthyPosition:
      return "UnhealthyPosition";
    case ErrorCode::kNoOutstandingDebt:
      return "NoOutstandingDebt";
    case ErrorCode::kPriceNotSet:
      return "PriceNotSet";
    case ErrorCode::kStalePrice:
      return "StalePrice";
    case ErrorCode::kPositionHealthy:
      return "PositionHealthy";
    case ErrorCode::kArithmeticOverflow:
      return "ArithmeticOverflow";
    case ErrorCode::kTransferFailed:
      return "TransferFailed";
  }
  return "Unknown";
}

// Every rejected ledger, oracle or rate-model call throws this. The state of
// the component is unchanged when it propagates.
class LendingError : public std::runtime_error {
 public:
  LendingError(ErrorCode code, const std::string& detail)
      : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace common
}  // namespace lendcore
