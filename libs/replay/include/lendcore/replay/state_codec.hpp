#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "lendcore/ledger/lending_pool.hpp"
#include "lendcore/oracle/price_oracle.hpp"

namespace lendcore {
namespace replay {

// Everything a snapshot restores.
struct LedgerImage {
  ledger::PoolImage pool{};
  oracle::OracleImage oracle{};
};

// Field-by-field encodings in host byte order. Decoders throw std::runtime_error
// on truncated or trailing bytes.
std::vector<std::byte> encode(const ledger::CommitRecord& record);
ledger::CommitRecord decode_ledger_commit(std::span<const std::byte> data);

std::vector<std::byte> encode(const oracle::OracleCommit& commit);
oracle::OracleCommit decode_oracle_commit(std::span<const std::byte> data);

std::vector<std::byte> encode(const LedgerImage& image);
LedgerImage decode_ledger_image(std::span<const std::byte> data);

}  // namespace replay
}  // namespace lendcore
