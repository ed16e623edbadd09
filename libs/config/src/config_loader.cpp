#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <set>
#include <sstream>

#include "lendcore/auth/authenticator.hpp"

namespace lendcore {
namespace config {

namespace {

constexpr std::size_t kMaxSymbolLength = 15;
constexpr std::int64_t kRateScale = 10'000'000;
constexpr std::int64_t kMaxBorrowRate = 1'000'000'000;
constexpr std::int32_t kBasisPointDenominator = 10'000;
constexpr std::array<std::string_view, 7> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

template <typename T>
T get_or(const toml::table& tbl, std::string_view key, T default_val) {
  if (auto val = tbl[key].value<T>()) {
    return *val;
  }
  return default_val;
}

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

AssetsConfig parse_assets(const toml::table& root) {
  AssetsConfig cfg;
  if (auto* assets = root["assets"].as_table()) {
    cfg.lendable = get_str_or(*assets, "lendable", cfg.lendable);
    cfg.collateral = get_str_or(*assets, "collateral", cfg.collateral);
  }
  return cfg;
}

OracleConfig parse_oracle(const toml::table& root) {
  OracleConfig cfg;
  if (auto* oracle = root["oracle"].as_table()) {
    cfg.admin = static_cast<std::uint64_t>(get_int_or(*oracle, "admin", static_cast<std::int64_t>(cfg.admin)));
    cfg.staleness_threshold_seconds = static_cast<std::uint64_t>(
        get_int_or(*oracle, "staleness_threshold_seconds", static_cast<std::int64_t>(cfg.staleness_threshold_seconds)));
    if (auto* pegged = (*oracle)["pegged_assets"].as_array()) {
      cfg.pegged_assets.clear();
      for (const auto& elem : *pegged) {
        if (auto symbol = elem.value<std::string_view>()) {
          cfg.pegged_assets.emplace_back(*symbol);
        }
      }
    }
  }
  return cfg;
}

RateModelConfig parse_rate_model(const toml::table& root) {
  RateModelConfig cfg;
  if (auto* model = root["rate_model"].as_table()) {
    cfg.base_rate = get_int_or(*model, "base_rate", cfg.base_rate);
    cfg.slope1 = get_int_or(*model, "slope1", cfg.slope1);
    cfg.slope2 = get_int_or(*model, "slope2", cfg.slope2);
    cfg.optimal_utilization = get_int_or(*model, "optimal_utilization", cfg.optimal_utilization);
  }
  return cfg;
}

RiskConfig parse_risk(const toml::table& root) {
  RiskConfig cfg;
  if (auto* risk = root["risk"].as_table()) {
    cfg.ltv_basis_points = static_cast<std::int32_t>(get_int_or(*risk, "ltv_bp", cfg.ltv_basis_points));
    cfg.liquidation_threshold_basis_points = static_cast<std::int32_t>(
        get_int_or(*risk, "liquidation_threshold_bp", cfg.liquidation_threshold_basis_points));
    cfg.close_factor_basis_points =
        static_cast<std::int32_t>(get_int_or(*risk, "close_factor_bp", cfg.close_factor_basis_points));
    cfg.liquidation_bonus_basis_points =
        static_cast<std::int32_t>(get_int_or(*risk, "liquidation_bonus_bp", cfg.liquidation_bonus_basis_points));
  }
  return cfg;
}

PoolConfig parse_pool(const toml::table& root) {
  PoolConfig cfg;
  if (auto* pool = root["pool"].as_table()) {
    cfg.admin = static_cast<std::uint64_t>(get_int_or(*pool, "admin", static_cast<std::int64_t>(cfg.admin)));
    cfg.prune_empty_accounts = get_or(*pool, "prune_empty_accounts", cfg.prune_empty_accounts);
    cfg.max_accrual_step_seconds = static_cast<std::uint64_t>(
        get_int_or(*pool, "max_accrual_step_seconds", static_cast<std::int64_t>(cfg.max_accrual_step_seconds)));
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.wal_path = get_str_or(*persistence, "wal_path", cfg.wal_path.string());
    cfg.snapshot_dir = get_str_or(*persistence, "snapshot_dir", cfg.snapshot_dir.string());
    cfg.wal_flush_threshold = static_cast<std::size_t>(
        get_int_or(*persistence, "wal_flush_threshold", static_cast<std::int64_t>(cfg.wal_flush_threshold)));
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_or(*telemetry, "enabled", cfg.enabled);
    cfg.buffer_size = static_cast<std::size_t>(
        get_int_or(*telemetry, "buffer_size", static_cast<std::int64_t>(cfg.buffer_size)));
    cfg.log_level = get_str_or(*telemetry, "log_level", cfg.log_level);
  }
  return cfg;
}

std::vector<PrincipalConfig> parse_principals(const toml::table& root) {
  std::vector<PrincipalConfig> principals;
  if (auto* arr = root["principals"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* principal_tbl = elem.as_table()) {
        PrincipalConfig principal;
        principal.account = static_cast<std::uint64_t>(get_int_or(*principal_tbl, "account", 0));
        principal.public_key = get_str_or(*principal_tbl, "public_key", "");
        principals.push_back(std::move(principal));
      }
    }
  }
  return principals;
}

LendcoreConfig parse_config(const toml::table& root) {
  LendcoreConfig cfg;
  cfg.assets = parse_assets(root);
  cfg.oracle = parse_oracle(root);
  cfg.rate_model = parse_rate_model(root);
  cfg.risk = parse_risk(root);
  cfg.pool = parse_pool(root);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.principals = parse_principals(root);
  return cfg;
}

void check_symbol(std::vector<ValidationError>& errors, const std::string& field, const std::string& symbol) {
  if (symbol.empty() || symbol.size() > kMaxSymbolLength) {
    errors.push_back({field, "symbol must be 1-15 characters"});
  }
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const LendcoreConfig& config) {
  std::vector<ValidationError> errors;

  check_symbol(errors, "assets.lendable", config.assets.lendable);
  check_symbol(errors, "assets.collateral", config.assets.collateral);
  if (config.assets.lendable == config.assets.collateral) {
    errors.push_back({"assets", "lendable and collateral must differ"});
  }

  if (config.oracle.admin == 0) {
    errors.push_back({"oracle.admin", "admin account must be greater than 0"});
  }
  for (std::size_t i = 0; i < config.oracle.pegged_assets.size(); ++i) {
    check_symbol(errors, "oracle.pegged_assets[" + std::to_string(i) + "]", config.oracle.pegged_assets[i]);
  }

  const auto& model = config.rate_model;
  if (model.optimal_utilization <= 0 || model.optimal_utilization >= kRateScale) {
    errors.push_back({"rate_model.optimal_utilization", "must lie in (0, 10000000)"});
  }
  if (model.base_rate < 0 || model.slope1 < 0 || model.slope2 < 0) {
    errors.push_back({"rate_model", "rates must be non-negative"});
  } else if (model.base_rate > kMaxBorrowRate || model.slope1 > kMaxBorrowRate || model.slope2 > kMaxBorrowRate ||
             model.base_rate + model.slope1 + model.slope2 > kMaxBorrowRate) {
    errors.push_back({"rate_model", "base_rate + slope1 + slope2 must not exceed 1000000000"});
  }

  const auto& risk = config.risk;
  if (risk.ltv_basis_points <= 0) {
    errors.push_back({"risk.ltv_bp", "must be positive"});
  }
  if (risk.ltv_basis_points >= risk.liquidation_threshold_basis_points) {
    errors.push_back({"risk", "ltv_bp must be < liquidation_threshold_bp"});
  }
  if (risk.liquidation_threshold_basis_points >= kBasisPointDenominator) {
    errors.push_back({"risk.liquidation_threshold_bp", "must be < 10000"});
  }
  if (risk.close_factor_basis_points <= 0 || risk.close_factor_basis_points > kBasisPointDenominator) {
    errors.push_back({"risk.close_factor_bp", "must lie in (0, 10000]"});
  }
  if (risk.liquidation_bonus_basis_points < 0 || risk.liquidation_bonus_basis_points > kBasisPointDenominator) {
    errors.push_back({"risk.liquidation_bonus_bp", "must lie in [0, 10000]"});
  }

  if (config.pool.admin == 0) {
    errors.push_back({"pool.admin", "admin account must be greater than 0"});
  }
  if (config.pool.max_accrual_step_seconds == 0) {
    errors.push_back({"pool.max_accrual_step_seconds", "must be greater than 0"});
  }

  if (config.persistence.wal_path.empty()) {
    errors.push_back({"persistence.wal_path", "wal_path cannot be empty"});
  }

  if (config.persistence.snapshot_dir.empty()) {
    errors.push_back({"persistence.snapshot_dir", "snapshot_dir cannot be empty"});
  }

  if (config.telemetry.buffer_size == 0) {
    errors.push_back({"telemetry.buffer_size", "must be greater than 0"});
  }
  if (std::find(kLogLevels.begin(), kLogLevels.end(), config.telemetry.log_level) == kLogLevels.end()) {
    errors.push_back({"telemetry.log_level", "unknown level '" + config.telemetry.log_level + "'"});
  }

  std::set<std::uint64_t> seen;
  for (std::size_t i = 0; i < config.principals.size(); ++i) {
    const auto& principal = config.principals[i];
    std::string prefix = "principals[" + std::to_string(i) + "]";

    if (principal.account == 0) {
      errors.push_back({prefix + ".account", "account must be greater than 0"});
    } else if (!seen.insert(principal.account).second) {
      errors.push_back({prefix + ".account", "duplicate account " + std::to_string(principal.account)});
    }

    if (!auth::Authenticator::parse_public_key(principal.public_key)) {
      errors.push_back({prefix + ".public_key", "expected 64 hex characters"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# LendCore Configuration
# Generated default configuration

[assets]
lendable = "USDC"
collateral = "XLM"

[oracle]
admin = 1
staleness_threshold_seconds = 3600
pegged_assets = ["USDC"]

[rate_model]
base_rate = 0
slope1 = 400000              # 4% at optimal utilization
slope2 = 7500000             # +75% from optimal to full utilization
optimal_utilization = 8000000  # 80%

[risk]
ltv_bp = 7500                  # 75%
liquidation_threshold_bp = 8000  # 80%
close_factor_bp = 10000
liquidation_bonus_bp = 0

[pool]
admin = 1
prune_empty_accounts = true
max_accrual_step_seconds = 31536000

[persistence]
wal_path = "/var/lib/lendcore/journal.wal"
snapshot_dir = "/var/lib/lendcore/snapshots"
wal_flush_threshold = 128

[telemetry]
enabled = true
buffer_size = 1024
log_level = "info"

# [[principals]]
# account = 1
# public_key = "<64 hex characters>"
)";
}

}  // namespace config
}  // namespace lendcore
