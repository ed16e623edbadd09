#include "lendcore/oracle/price_oracle.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

#include "lendcore/common/error.hpp"
#include "lendcore/common/fixed_point.hpp"

namespace lendcore {
namespace oracle {

using common::ErrorCode;
using common::LendingError;

void validate_asset_symbol(std::string_view asset) {
  if (asset.empty() || asset.size() > common::kMaxAssetSymbolLength) {
    throw LendingError(ErrorCode::kInvalidInput,
                       "asset symbol must be 1-" + std::to_string(common::kMaxAssetSymbolLength) + " characters");
  }
}

PriceOracle::PriceOracle(const common::Clock& clock, auth::Authorizer& authorizer, telemetry::EventSink& events)
    : clock_(clock), authorizer_(authorizer), events_(events) {}

void PriceOracle::initialize(const OracleSettings& settings) {
  if (initialized_) {
    throw LendingError(ErrorCode::kAlreadyInitialized, "price oracle already initialized");
  }
  for (const auto& asset : settings.pegged_assets) {
    validate_asset_symbol(asset);
  }

  admin_ = settings.admin;
  staleness_threshold_ = settings.staleness_threshold_seconds;
  const auto now = clock_.now();
  for (const auto& asset : settings.pegged_assets) {
    prices_.insert_or_assign(asset, PriceEntry{.price = common::kPriceScale, .last_update = now});
  }
  initialized_ = true;
  spdlog::info("price oracle initialized admin={} staleness={}s pegged={}",
               admin_, staleness_threshold_, settings.pegged_assets.size());
}

void PriceOracle::set_price(const auth::Credential& credential, std::string_view asset, std::int64_t price) {
  require_admin(credential, {.kind = auth::ActionKind::kSetPrice, .subject = 0, .amount = price, .asset = asset});
  validate_asset_symbol(asset);
  if (price <= 0) {
    throw LendingError(ErrorCode::kInvalidInput, "price must be positive");
  }
  store_price(asset, price, telemetry::EventKind::kPriceUpdated);
}

void PriceOracle::set_price_chaos(const auth::Credential& credential, std::string_view asset, std::int64_t price) {
  require_admin(credential, {.kind = auth::ActionKind::kSetPriceChaos, .subject = 0, .amount = price, .asset = asset});
  validate_asset_symbol(asset);
  if (price <= 0) {
    throw LendingError(ErrorCode::kInvalidInput, "price must be positive");
  }
  // Halving truncates: a price of 1 stores 0, which leaves the asset unpriced
  // (get_price returns 0 and get_price_safe fails with PriceNotSet).
  spdlog::warn("chaos price for {}: {} halved to {}", asset, price, price / 2);
  store_price(asset, price / 2, telemetry::EventKind::kPriceChaos);
}

void PriceOracle::set_staleness_threshold(const auth::Credential& credential, std::uint64_t seconds) {
  require_admin(credential, {.kind = auth::ActionKind::kSetStalenessThreshold,
                             .subject = 0,
                             .amount = static_cast<std::int64_t>(seconds),
                             .asset = {}});
  staleness_threshold_ = seconds;
  notify(std::nullopt);
}

void PriceOracle::set_admin(const auth::Credential& credential, common::AccountId new_admin) {
  require_admin(credential, {.kind = auth::ActionKind::kSetAdmin, .subject = new_admin, .amount = 0, .asset = {}});
  admin_ = new_admin;
  spdlog::info("price oracle admin transferred to {}", new_admin);
  notify(std::nullopt);
}

std::int64_t PriceOracle::get_price(std::string_view asset) const {
  const auto* entry = find(asset);
  return entry ? entry->price : 0;
}

std::int64_t PriceOracle::get_price_safe(std::string_view asset) const {
  const auto* entry = find(asset);
  if (!entry || entry->price == 0) {
    throw LendingError(ErrorCode::kPriceNotSet, "no price for " + std::string(asset));
  }
  if (is_stale_at(*entry, clock_.now())) {
    throw LendingError(ErrorCode::kStalePrice,
                       std::string(asset) + " price last updated at " + std::to_string(entry->last_update));
  }
  return entry->price;
}

bool PriceOracle::is_stale(std::string_view asset) const {
  const auto* entry = find(asset);
  return is_stale_at(entry ? *entry : PriceEntry{}, clock_.now());
}

common::TimestampSec PriceOracle::last_update(std::string_view asset) const {
  const auto* entry = find(asset);
  return entry ? entry->last_update : 0;
}

std::int64_t PriceOracle::asset_to_usd(std::string_view asset, std::int64_t amount) const {
  return common::asset_to_usd(amount, get_price(asset));
}

std::int64_t PriceOracle::usd_to_asset(std::string_view asset, std::int64_t usd_amount) const {
  const std::int64_t price = get_price(asset);
  if (price == 0) {
    throw LendingError(ErrorCode::kPriceNotSet, "no price for " + std::string(asset));
  }
  return common::usd_to_asset(usd_amount, price);
}

common::AccountId PriceOracle::admin() const {
  if (!initialized_) {
    throw LendingError(ErrorCode::kNotInitialized, "price oracle not initialized");
  }
  return admin_;
}

OracleImage PriceOracle::export_image() const {
  return OracleImage{.admin = admin_, .staleness_threshold_seconds = staleness_threshold_, .prices = prices_};
}

void PriceOracle::restore(const OracleImage& image) {
  admin_ = image.admin;
  staleness_threshold_ = image.staleness_threshold_seconds;
  prices_ = image.prices;
  initialized_ = true;
}

void PriceOracle::apply(const OracleCommit& commit) {
  admin_ = commit.admin;
  staleness_threshold_ = commit.staleness_threshold_seconds;
  if (commit.price) {
    prices_.insert_or_assign(commit.price->first, commit.price->second);
  }
  initialized_ = true;
}

void PriceOracle::require_admin(const auth::Credential& credential, const auth::Action& action) {
  if (!initialized_) {
    throw LendingError(ErrorCode::kNotInitialized, "price oracle not initialized");
  }
  authorizer_.require(credential, admin_, action);
}

void PriceOracle::store_price(std::string_view asset, std::int64_t price, telemetry::EventKind kind) {
  const PriceEntry entry{.price = price, .last_update = clock_.now()};
  auto it = prices_.find(asset);
  if (it == prices_.end()) {
    it = prices_.emplace(std::string(asset), entry).first;
  } else {
    it->second = entry;
  }

  events_.publish({.kind = kind,
                   .account = admin_,
                   .amount = price,
                   .timestamp = entry.last_update,
                   .asset = std::string(asset)});
  notify(std::make_pair(it->first, entry));
}

const PriceEntry* PriceOracle::find(std::string_view asset) const {
  auto it = prices_.find(asset);
  if (it == prices_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool PriceOracle::is_stale_at(const PriceEntry& entry, common::TimestampSec now) const noexcept {
  if (now <= entry.last_update) {
    return false;
  }
  return now - entry.last_update > staleness_threshold_;
}

void PriceOracle::notify(std::optional<std::pair<std::string, PriceEntry>> price) {
  if (!commit_hook_) {
    return;
  }
  commit_hook_(OracleCommit{.admin = admin_,
                            .staleness_threshold_seconds = staleness_threshold_,
                            .price = std::move(price)});
}

}  // namespace oracle
}  // namespace lendcore
