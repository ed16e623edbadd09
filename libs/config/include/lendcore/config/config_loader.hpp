#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lendcore {
namespace config {

struct AssetsConfig {
  std::string lendable{"USDC"};
  std::string collateral{"XLM"};
};

struct OracleConfig {
  std::uint64_t admin{1};
  std::uint64_t staleness_threshold_seconds{3600};
  std::vector<std::string> pegged_assets{"USDC"};
};

// Scale 1e7 throughout.
struct RateModelConfig {
  std::int64_t base_rate{0};
  std::int64_t slope1{400'000};
  std::int64_t slope2{7'500'000};
  std::int64_t optimal_utilization{8'000'000};
};

struct RiskConfig {
  std::int32_t ltv_basis_points{7'500};
  std::int32_t liquidation_threshold_basis_points{8'000};
  std::int32_t close_factor_basis_points{10'000};
  std::int32_t liquidation_bonus_basis_points{0};
};

struct PoolConfig {
  std::uint64_t admin{1};
  bool prune_empty_accounts{true};
  std::uint64_t max_accrual_step_seconds{31'536'000};
};

struct PersistenceConfig {
  std::filesystem::path wal_path{"/var/lib/lendcore/journal.wal"};
  std::filesystem::path snapshot_dir{"/var/lib/lendcore/snapshots"};
  std::size_t wal_flush_threshold{128};
};

struct TelemetryConfig {
  bool enabled{true};
  std::size_t buffer_size{1024};
  std::string log_level{"info"};
};

struct PrincipalConfig {
  std::uint64_t account{0};
  std::string public_key;  // ed25519, hex
};

struct LendcoreConfig {
  AssetsConfig assets;
  OracleConfig oracle;
  RateModelConfig rate_model;
  RiskConfig risk;
  PoolConfig pool;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
  std::vector<PrincipalConfig> principals;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LendcoreConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LendcoreConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
