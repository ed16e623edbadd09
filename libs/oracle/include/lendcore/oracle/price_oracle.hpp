#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/auth/authorizer.hpp"
#include "lendcore/common/clock.hpp"
#include "lendcore/common/types.hpp"
#include "lendcore/telemetry/event_sink.hpp"

namespace lendcore {
namespace oracle {

inline constexpr std::uint64_t kDefaultStalenessSeconds = 3600;

struct PriceEntry {
  std::int64_t price{0};  // USD per unit, scale 1e7
  common::TimestampSec last_update{0};
};

struct OracleSettings {
  common::AccountId admin{0};
  std::uint64_t staleness_threshold_seconds{kDefaultStalenessSeconds};
  std::vector<std::string> pegged_assets{"USDC"};  // seeded at 1.00 USD
};

// Full oracle state, for snapshots and journal replay.
struct OracleImage {
  common::AccountId admin{0};
  std::uint64_t staleness_threshold_seconds{kDefaultStalenessSeconds};
  std::map<std::string, PriceEntry, std::less<>> prices{};
};

struct OracleCommit {
  common::AccountId admin{0};
  std::uint64_t staleness_threshold_seconds{0};
  std::optional<std::pair<std::string, PriceEntry>> price{};
};

// Same contract as the pool's commit hook: must not throw.
using OracleCommitHook = std::function<void(const OracleCommit&)>;

class PriceOracle {
 public:
  PriceOracle(const common::Clock& clock, auth::Authorizer& authorizer, telemetry::EventSink& events);

  void initialize(const OracleSettings& settings);
  [[nodiscard]] bool initialized() const noexcept { return initialized_; }

  // Admin-only mutations.
  void set_price(const auth::Credential& credential, std::string_view asset, std::int64_t price);
  // Stores half of `price`; stress path kept separate from set_price.
  void set_price_chaos(const auth::Credential& credential, std::string_view asset, std::int64_t price);
  void set_staleness_threshold(const auth::Credential& credential, std::uint64_t seconds);
  void set_admin(const auth::Credential& credential, common::AccountId new_admin);

  // 0 when the asset was never priced.
  [[nodiscard]] std::int64_t get_price(std::string_view asset) const;
  // Throws kPriceNotSet or kStalePrice.
  [[nodiscard]] std::int64_t get_price_safe(std::string_view asset) const;
  [[nodiscard]] bool is_stale(std::string_view asset) const;
  [[nodiscard]] common::TimestampSec last_update(std::string_view asset) const;

  [[nodiscard]] std::int64_t asset_to_usd(std::string_view asset, std::int64_t amount) const;
  [[nodiscard]] std::int64_t usd_to_asset(std::string_view asset, std::int64_t usd_amount) const;

  [[nodiscard]] common::AccountId admin() const;
  [[nodiscard]] std::uint64_t staleness_threshold() const noexcept { return staleness_threshold_; }

  void set_commit_hook(OracleCommitHook hook) { commit_hook_ = std::move(hook); }
  [[nodiscard]] OracleImage export_image() const;
  void restore(const OracleImage& image);
  void apply(const OracleCommit& commit);

 private:
  const common::Clock& clock_;
  auth::Authorizer& authorizer_;
  telemetry::EventSink& events_;
  OracleCommitHook commit_hook_{};

  bool initialized_{false};
  common::AccountId admin_{0};
  std::uint64_t staleness_threshold_{kDefaultStalenessSeconds};
  std::map<std::string, PriceEntry, std::less<>> prices_{};

  void require_admin(const auth::Credential& credential, const auth::Action& action);
  void store_price(std::string_view asset, std::int64_t price, telemetry::EventKind kind);
  [[nodiscard]] const PriceEntry* find(std::string_view asset) const;
  [[nodiscard]] bool is_stale_at(const PriceEntry& entry, common::TimestampSec now) const noexcept;
  void notify(std::optional<std::pair<std::string, PriceEntry>> price);
};

void validate_asset_symbol(std::string_view asset);

}  // namespace oracle
}  // namespace lendcore
