#pragma once

#include <cstdint>
#include <optional>

namespace lendcore {
namespace interest {

// All fields scale 1e7 (10'000'000 == 100% APR / 100% utilization).
struct RateCurveParameters {
  std::int64_t base_rate{0};
  std::int64_t slope1{400'000};
  std::int64_t slope2{7'500'000};
  std::int64_t optimal_utilization{8'000'000};
};

// Upper bound on base + slope1 + slope2 (10'000% APR). Keeps accrual
// products inside 128 bits.
inline constexpr std::int64_t kMaxBorrowRate = 1'000'000'000;

// Kinked borrow-rate curve:
//   u <= optimal: base + u * slope1 / optimal
//   u >  optimal: base + slope1 + ((u - optimal) * SCALE / (SCALE - optimal)) * slope2 / SCALE
class InterestRateModel {
 public:
  void initialize(const RateCurveParameters& params);
  [[nodiscard]] bool initialized() const noexcept { return params_.has_value(); }

  [[nodiscard]] std::int64_t borrow_rate(std::int64_t utilization) const;
  // borrow_rate(u) * u / SCALE; no reserve factor is taken.
  [[nodiscard]] std::int64_t supply_rate(std::int64_t utilization) const;

  [[nodiscard]] const RateCurveParameters& parameters() const;
  [[nodiscard]] std::int64_t base_rate() const { return parameters().base_rate; }
  [[nodiscard]] std::int64_t slope1() const { return parameters().slope1; }
  [[nodiscard]] std::int64_t slope2() const { return parameters().slope2; }
  [[nodiscard]] std::int64_t optimal_utilization() const { return parameters().optimal_utilization; }

  static void validate(const RateCurveParameters& params);

 private:
  std::optional<RateCurveParameters> params_{};
};

}  // namespace interest
}  // namespace lendcore
