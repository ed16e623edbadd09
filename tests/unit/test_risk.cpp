#include "test_risk.hpp"

#include <cassert>
#include <limits>

#include "lendcore/risk/risk_engine.hpp"
#include "test_support.hpp"

namespace lendcore::tests {

void test_risk_engine() {
  risk::RiskEngine risk;
  const risk::AssetPrices prices{.collateral_price = 2 * kOneUsd, .borrow_price = kOneUsd};

  assert(risk.collateral_value_usd(1'000, prices) == 2'000);
  assert(risk.max_borrow_usd(1'000, prices) == 1'500);
  assert(risk.max_borrow(1'000, prices) == 1'500);
  assert(risk.borrow_value_usd(1'000, prices) == 1'000);

  const auto summary = risk.summarize({.collateral = 1'000, .debt = 1'000}, prices);
  assert(summary.collateral_value_usd == 2'000);
  assert(summary.borrow_value_usd == 1'000);
  assert(summary.max_borrow == 1'500);
  assert(summary.health_factor == 16'000'000);
  assert(!summary.liquidatable);

  // Borrow asset worth 2.00: capacity halves in units.
  const risk::AssetPrices dear{.collateral_price = 2 * kOneUsd, .borrow_price = 2 * kOneUsd};
  assert(risk.max_borrow(1'000, dear) == 750);

  expect_error(common::ErrorCode::kPriceNotSet,
               [&] { (void)risk.max_borrow(1'000, {.collateral_price = kOneUsd, .borrow_price = 0}); });
  expect_error(common::ErrorCode::kPriceNotSet, [&] {
    (void)risk.health_factor({.collateral = 1'000, .debt = 1}, {.collateral_price = 0, .borrow_price = kOneUsd});
  });
}

void test_health_factor_boundaries() {
  risk::RiskEngine risk;
  const risk::AssetPrices par{.collateral_price = kOneUsd, .borrow_price = kOneUsd};

  // Exactly 1.0 is safe; one unit of extra debt is not.
  assert(risk.health_factor({.collateral = 12'500'000, .debt = 10'000'000}, par) == common::kRateScale);
  assert(!risk.is_liquidatable({.collateral = 12'500'000, .debt = 10'000'000}, par));
  assert(risk.health_factor({.collateral = 12'500'000, .debt = 10'000'001}, par) == 9'999'999);
  assert(risk.is_liquidatable({.collateral = 12'500'000, .debt = 10'000'001}, par));

  // No debt: the sentinel, whatever the collateral or prices.
  assert(risk.health_factor({.collateral = 0, .debt = 0}, par) == risk::kInfiniteHealthFactor);
  assert(risk.health_factor({.collateral = 1'000'000'000, .debt = 0}, {}) == risk::kInfiniteHealthFactor);
  assert(!risk.is_liquidatable({.collateral = 0, .debt = 0}, par));

  // Dust debt worth less than one USD unit still counts.
  const risk::AssetPrices dust{.collateral_price = kOneUsd, .borrow_price = 1};
  assert(risk.borrow_value_usd(1, dust) == 0);
  assert(risk.health_factor({.collateral = 0, .debt = 1}, dust) == 0);
  assert(risk.health_factor({.collateral = 10, .debt = 1}, dust) == 80'000'000);

  // Ratios beyond 64 bits saturate.
  const auto huge = risk.health_factor({.collateral = 900'000'000'000'000'000, .debt = 1}, dust);
  assert(huge == std::numeric_limits<std::int64_t>::max());
}

void test_risk_parameter_validation() {
  risk::validate({});
  risk::validate({.ltv_basis_points = 1, .liquidation_threshold_basis_points = 9'999});
  risk::validate({.close_factor_basis_points = 1, .liquidation_bonus_basis_points = 10'000});

  const auto invalid = [](const risk::RiskParameters& params) {
    expect_error(common::ErrorCode::kInvalidInput, [&] { risk::validate(params); });
  };
  invalid({.ltv_basis_points = 0});
  invalid({.ltv_basis_points = 8'000, .liquidation_threshold_basis_points = 8'000});
  invalid({.ltv_basis_points = 7'500, .liquidation_threshold_basis_points = 10'000});
  invalid({.close_factor_basis_points = 0});
  invalid({.close_factor_basis_points = 10'001});
  invalid({.liquidation_bonus_basis_points = -1});
  invalid({.liquidation_bonus_basis_points = 10'001});

  expect_error(common::ErrorCode::kInvalidInput,
               [] { risk::RiskEngine engine{{.ltv_basis_points = 9'000, .liquidation_threshold_basis_points = 8'000}}; });

  risk::RiskEngine engine;
  expect_error(common::ErrorCode::kInvalidInput, [&] { engine.set_parameters({.ltv_basis_points = -1}); });
  assert(engine.parameters().ltv_basis_points == 7'500);

  // Packed parameters distinguish every field.
  const risk::RiskParameters base{};
  assert(risk::pack(base) != risk::pack({.ltv_basis_points = 7'499}));
  assert(risk::pack(base) != risk::pack({.liquidation_threshold_basis_points = 8'001}));
  assert(risk::pack(base) != risk::pack({.close_factor_basis_points = 5'000}));
  assert(risk::pack(base) != risk::pack({.liquidation_bonus_basis_points = 100}));
  assert(risk::pack(base) == risk::pack(risk::RiskParameters{}));
}

}  // namespace lendcore::tests
