#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include "lendcore/auth/authenticator.hpp"
#include "lendcore/auth/authorizer.hpp"
#include "lendcore/common/clock.hpp"
#include "lendcore/common/error.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/interest/interest_rate_model.hpp"
#include "lendcore/ledger/lending_pool.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/replay/replay_driver.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/telemetry/event_sink.hpp"
#include "lendcore/token/token_gateway.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

int run(const lendcore::config::LendcoreConfig& cfg) {
  using namespace lendcore;

  auth::Authenticator authenticator;
  for (const auto& principal : cfg.principals) {
    // Keys were checked by ConfigLoader::validate.
    if (auto key = auth::Authenticator::parse_public_key(principal.public_key)) {
      authenticator.register_principal(principal.account, *key);
    }
  }
  spdlog::info("auth: {} registered principals", authenticator.principal_count());

  common::SystemClock clock;
  auth::SignatureAuthorizer authorizer{authenticator};
  token::InMemoryTokenGateway tokens;
  telemetry::EventSink events{cfg.telemetry.buffer_size, cfg.telemetry.enabled};

  oracle::PriceOracle price_oracle{clock, authorizer, events};
  price_oracle.initialize({.admin = cfg.oracle.admin,
                           .staleness_threshold_seconds = cfg.oracle.staleness_threshold_seconds,
                           .pegged_assets = cfg.oracle.pegged_assets});

  interest::InterestRateModel rate_model;
  rate_model.initialize({.base_rate = cfg.rate_model.base_rate,
                         .slope1 = cfg.rate_model.slope1,
                         .slope2 = cfg.rate_model.slope2,
                         .optimal_utilization = cfg.rate_model.optimal_utilization});

  ledger::LendingPool pool{{.clock = clock, .authorizer = authorizer, .tokens = tokens, .events = events},
                           price_oracle,
                           rate_model};
  pool.initialize({.admin = cfg.pool.admin,
                   .lendable_asset = cfg.assets.lendable,
                   .collateral_asset = cfg.assets.collateral,
                   .risk = {.ltv_basis_points = cfg.risk.ltv_basis_points,
                            .liquidation_threshold_basis_points = cfg.risk.liquidation_threshold_basis_points,
                            .close_factor_basis_points = cfg.risk.close_factor_basis_points,
                            .liquidation_bonus_basis_points = cfg.risk.liquidation_bonus_basis_points},
                   .accrual = {.max_step_seconds = cfg.pool.max_accrual_step_seconds},
                   .prune_empty_accounts = cfg.pool.prune_empty_accounts});

  std::filesystem::create_directories(cfg.persistence.snapshot_dir);
  snapshot::Store snapshot{cfg.persistence.snapshot_dir};
  const auto stats = replay::recover(snapshot.directory(), cfg.persistence.wal_path, pool, price_oracle);

  wal::Writer writer{cfg.persistence.wal_path, cfg.persistence.wal_flush_threshold};
  replay::CommitJournal journal{writer};
  journal.attach(pool, price_oracle);

  const auto accrual = pool.accrue_interest();
  if (accrual.elapsed_seconds > 0) {
    spdlog::info("accrued {} over {}s at rate {}", accrual.interest, accrual.elapsed_seconds, accrual.borrow_rate);
  }

  const auto market = pool.market_info();
  spdlog::info("market {}/{}: deposits={} borrows={} liquidity={} utilization={} borrow_rate={} supply_rate={}",
               cfg.assets.lendable, cfg.assets.collateral, market.total_deposits, market.total_borrows,
               market.available_liquidity, market.utilization, market.borrow_rate, market.supply_rate);
  spdlog::info("accounts: {} open, {} events buffered", pool.accounts().size(), events.drain().size());

  journal.detach(pool, price_oracle);
  const auto covered = writer.next_sequence() - 1;
  if (!journal.healthy()) {
    // The journal has a gap; only a snapshot of the live state covers it.
    spdlog::critical("journal failed: {}; {} commits missing, snapshotting at seq {}", journal.failure(),
                     journal.dropped(), covered);
    replay::write_snapshot(snapshot, covered, pool, price_oracle);
    return 1;
  }

  writer.sync();
  if (covered > stats.snapshot_sequence || !stats.snapshot_loaded) {
    replay::write_snapshot(snapshot, covered, pool, price_oracle);
  }

  spdlog::info("lendcored finished");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::LendcoreConfig cfg;

  if (config_path.empty()) {
    spdlog::info("No config file found, using defaults");
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    spdlog::info("Loading config from: {}", config_path.string());
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        spdlog::warn("Validation error [{}]: {}", err.field, err.message);
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  spdlog::set_level(spdlog::level::from_str(cfg.telemetry.log_level));
  spdlog::info("Config loaded: {} principals, journal {}", cfg.principals.size(), cfg.persistence.wal_path.string());

  try {
    return run(cfg);
  } catch (const common::LendingError& ex) {
    spdlog::critical("ledger error {}: {}", static_cast<unsigned>(ex.code()), ex.what());
  } catch (const std::exception& ex) {
    spdlog::critical("lendcored failed: {}", ex.what());
  }
  return 1;
}
