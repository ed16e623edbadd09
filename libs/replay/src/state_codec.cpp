#include "lendcore/replay/state_codec.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace lendcore {
namespace replay {

namespace {

constexpr std::uint8_t kNoAccount = 0;
constexpr std::uint8_t kHasAccount = 1;

template <typename T>
void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("state decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

void append_symbol(std::vector<std::byte>& buffer, const std::string& symbol) {
  if (symbol.size() > common::kMaxAssetSymbolLength) {
    throw std::runtime_error("asset symbol too long to encode: " + symbol);
  }
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(symbol.size()));
  const auto bytes = std::as_bytes(std::span(symbol.data(), symbol.size()));
  buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

std::string read_symbol(std::span<const std::byte> data, std::size_t& offset) {
  const auto size = read_primitive<std::uint8_t>(data, offset);
  if (size > common::kMaxAssetSymbolLength || offset + size > data.size()) {
    throw std::runtime_error("state decode: bad asset symbol");
  }
  std::string symbol(size, '\0');
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), size,
              reinterpret_cast<std::byte*>(symbol.data()));
  offset += size;
  return symbol;
}

void append_pool(std::vector<std::byte>& buffer, const ledger::PoolState& pool) {
  append_primitive<std::int64_t>(buffer, pool.total_deposits);
  append_primitive<std::int64_t>(buffer, pool.total_borrows);
  append_primitive<std::int64_t>(buffer, pool.borrow_index);
  append_primitive<std::int64_t>(buffer, pool.supply_index);
  append_primitive<std::uint64_t>(buffer, pool.last_accrual_time);
  append_primitive<std::int64_t>(buffer, pool.borrow_index_carry);
  append_primitive<std::int64_t>(buffer, pool.undistributed_interest);
  append_primitive<std::uint64_t>(buffer, pool.supply_epoch);
}

ledger::PoolState read_pool(std::span<const std::byte> data, std::size_t& offset) {
  ledger::PoolState pool;
  pool.total_deposits = read_primitive<std::int64_t>(data, offset);
  pool.total_borrows = read_primitive<std::int64_t>(data, offset);
  pool.borrow_index = read_primitive<std::int64_t>(data, offset);
  pool.supply_index = read_primitive<std::int64_t>(data, offset);
  pool.last_accrual_time = read_primitive<std::uint64_t>(data, offset);
  pool.borrow_index_carry = read_primitive<std::int64_t>(data, offset);
  pool.undistributed_interest = read_primitive<std::int64_t>(data, offset);
  pool.supply_epoch = read_primitive<std::uint64_t>(data, offset);
  return pool;
}

void append_risk(std::vector<std::byte>& buffer, const risk::RiskParameters& params) {
  append_primitive<std::int32_t>(buffer, params.ltv_basis_points);
  append_primitive<std::int32_t>(buffer, params.liquidation_threshold_basis_points);
  append_primitive<std::int32_t>(buffer, params.close_factor_basis_points);
  append_primitive<std::int32_t>(buffer, params.liquidation_bonus_basis_points);
}

risk::RiskParameters read_risk(std::span<const std::byte> data, std::size_t& offset) {
  risk::RiskParameters params;
  params.ltv_basis_points = read_primitive<std::int32_t>(data, offset);
  params.liquidation_threshold_basis_points = read_primitive<std::int32_t>(data, offset);
  params.close_factor_basis_points = read_primitive<std::int32_t>(data, offset);
  params.liquidation_bonus_basis_points = read_primitive<std::int32_t>(data, offset);
  return params;
}

void append_account(std::vector<std::byte>& buffer, common::AccountId id, const ledger::AccountRecord& record) {
  append_primitive<std::uint64_t>(buffer, id);
  append_primitive<std::int64_t>(buffer, record.deposit_principal);
  append_primitive<std::int64_t>(buffer, record.supply_index_snapshot);
  append_primitive<std::int64_t>(buffer, record.borrow_principal);
  append_primitive<std::int64_t>(buffer, record.borrow_index_snapshot);
  append_primitive<std::int64_t>(buffer, record.collateral);
  append_primitive<std::uint64_t>(buffer, record.supply_epoch);
}

std::pair<common::AccountId, ledger::AccountRecord> read_account(std::span<const std::byte> data,
                                                                 std::size_t& offset) {
  const auto id = read_primitive<std::uint64_t>(data, offset);
  ledger::AccountRecord record;
  record.deposit_principal = read_primitive<std::int64_t>(data, offset);
  record.supply_index_snapshot = read_primitive<std::int64_t>(data, offset);
  record.borrow_principal = read_primitive<std::int64_t>(data, offset);
  record.borrow_index_snapshot = read_primitive<std::int64_t>(data, offset);
  record.collateral = read_primitive<std::int64_t>(data, offset);
  record.supply_epoch = read_primitive<std::uint64_t>(data, offset);
  return {id, record};
}

void append_price(std::vector<std::byte>& buffer, const std::string& asset, const oracle::PriceEntry& entry) {
  append_symbol(buffer, asset);
  append_primitive<std::int64_t>(buffer, entry.price);
  append_primitive<std::uint64_t>(buffer, entry.last_update);
}

std::pair<std::string, oracle::PriceEntry> read_price(std::span<const std::byte> data, std::size_t& offset) {
  std::string asset = read_symbol(data, offset);
  oracle::PriceEntry entry;
  entry.price = read_primitive<std::int64_t>(data, offset);
  entry.last_update = read_primitive<std::uint64_t>(data, offset);
  return {std::move(asset), entry};
}

void expect_consumed(std::span<const std::byte> data, std::size_t offset, const char* what) {
  if (offset != data.size()) {
    throw std::runtime_error(std::string("trailing bytes after ") + what);
  }
}

}  // namespace

std::vector<std::byte> encode(const ledger::CommitRecord& record) {
  std::vector<std::byte> buffer;
  buffer.reserve(128);
  append_primitive<std::uint8_t>(buffer, static_cast<std::uint8_t>(record.operation));
  append_primitive<std::uint64_t>(buffer, record.timestamp);
  append_pool(buffer, record.pool);
  append_risk(buffer, record.risk);
  if (record.account) {
    append_primitive<std::uint8_t>(buffer, kHasAccount);
    append_account(buffer, record.account->first, record.account->second);
  } else {
    append_primitive<std::uint8_t>(buffer, kNoAccount);
  }
  return buffer;
}

ledger::CommitRecord decode_ledger_commit(std::span<const std::byte> data) {
  std::size_t offset = 0;
  ledger::CommitRecord record;
  record.operation = static_cast<ledger::Operation>(read_primitive<std::uint8_t>(data, offset));
  record.timestamp = read_primitive<std::uint64_t>(data, offset);
  record.pool = read_pool(data, offset);
  record.risk = read_risk(data, offset);
  const auto has_account = read_primitive<std::uint8_t>(data, offset);
  if (has_account == kHasAccount) {
    record.account = read_account(data, offset);
  } else if (has_account != kNoAccount) {
    throw std::runtime_error("ledger commit: bad account flag");
  }
  expect_consumed(data, offset, "ledger commit");
  return record;
}

std::vector<std::byte> encode(const oracle::OracleCommit& commit) {
  std::vector<std::byte> buffer;
  buffer.reserve(48);
  append_primitive<std::uint64_t>(buffer, commit.admin);
  append_primitive<std::uint64_t>(buffer, commit.staleness_threshold_seconds);
  if (commit.price) {
    append_primitive<std::uint8_t>(buffer, 1);
    append_price(buffer, commit.price->first, commit.price->second);
  } else {
    append_primitive<std::uint8_t>(buffer, 0);
  }
  return buffer;
}

oracle::OracleCommit decode_oracle_commit(std::span<const std::byte> data) {
  std::size_t offset = 0;
  oracle::OracleCommit commit;
  commit.admin = read_primitive<std::uint64_t>(data, offset);
  commit.staleness_threshold_seconds = read_primitive<std::uint64_t>(data, offset);
  const auto has_price = read_primitive<std::uint8_t>(data, offset);
  if (has_price == 1) {
    commit.price = read_price(data, offset);
  } else if (has_price != 0) {
    throw std::runtime_error("oracle commit: bad price flag");
  }
  expect_consumed(data, offset, "oracle commit");
  return commit;
}

std::vector<std::byte> encode(const LedgerImage& image) {
  std::vector<std::byte> buffer;
  append_pool(buffer, image.pool.pool);
  append_risk(buffer, image.pool.risk);
  append_primitive<std::uint64_t>(buffer, image.pool.accounts.size());
  for (const auto& [id, record] : image.pool.accounts) {
    append_account(buffer, id, record);
  }

  append_primitive<std::uint64_t>(buffer, image.oracle.admin);
  append_primitive<std::uint64_t>(buffer, image.oracle.staleness_threshold_seconds);
  append_primitive<std::uint64_t>(buffer, image.oracle.prices.size());
  for (const auto& [asset, entry] : image.oracle.prices) {
    append_price(buffer, asset, entry);
  }
  return buffer;
}

LedgerImage decode_ledger_image(std::span<const std::byte> data) {
  std::size_t offset = 0;
  LedgerImage image;
  image.pool.pool = read_pool(data, offset);
  image.pool.risk = read_risk(data, offset);
  const auto accounts = read_primitive<std::uint64_t>(data, offset);
  for (std::uint64_t i = 0; i < accounts; ++i) {
    image.pool.accounts.push_back(read_account(data, offset));
  }

  image.oracle.admin = read_primitive<std::uint64_t>(data, offset);
  image.oracle.staleness_threshold_seconds = read_primitive<std::uint64_t>(data, offset);
  const auto prices = read_primitive<std::uint64_t>(data, offset);
  for (std::uint64_t i = 0; i < prices; ++i) {
    image.oracle.prices.insert(read_price(data, offset));
  }
  expect_consumed(data, offset, "ledger image");
  return image;
}

}  // namespace replay
}  // namespace lendcore
