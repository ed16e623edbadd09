#pragma once

#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/ledger/lending_pool.hpp"
#include "lendcore/oracle/price_oracle.hpp"
#include "lendcore/snapshot/snapshot_store.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace lendcore {
namespace replay {

// Feeds the latest snapshot, then every journal record newer than it, to the
// registered handlers.
class Driver {
 public:
  using SnapshotHandler = std::function<void(common::SequenceId, std::span<const std::byte>)>;
  using RecordHandler = std::function<void(const wal::Record&)>;

  Driver();

  void configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path);
  void set_snapshot_handler(SnapshotHandler handler);
  void set_record_handler(RecordHandler handler);
  // Returns the sequence of the last snapshot or record delivered (0 if none).
  common::SequenceId execute();

 private:
  snapshot::Store snapshot_store_{};
  std::filesystem::path wal_path_{};
  SnapshotHandler snapshot_handler_{};
  RecordHandler record_handler_{};
};

struct RecoveryStats {
  bool snapshot_loaded{false};
  common::SequenceId snapshot_sequence{0};
  std::size_t ledger_records{0};
  std::size_t oracle_records{0};
  common::SequenceId last_sequence{0};
};

// Restores pool and oracle state directly from disk; no request is
// re-authorized or re-validated. Both components must be initialized.
RecoveryStats recover(const std::filesystem::path& snapshot_directory,
                      const std::filesystem::path& wal_path,
                      ledger::LendingPool& pool,
                      oracle::PriceOracle& price_oracle);

// Routes every subsequent commit of `pool` and `price_oracle` into a
// journal. Commits reach it after they have taken effect, so an append
// failure cannot undo them: the first one is logged and latched, nothing is
// appended after it, and the owner checks healthy() and falls back to a
// snapshot of the in-memory state.
class CommitJournal {
 public:
  using Appender = std::function<std::uint64_t(const wal::RecordView&)>;

  explicit CommitJournal(wal::Writer& writer);
  explicit CommitJournal(Appender appender);
  CommitJournal(const CommitJournal&) = delete;
  CommitJournal& operator=(const CommitJournal&) = delete;

  // Both components must outlive the journal or be detached first.
  void attach(ledger::LendingPool& pool, oracle::PriceOracle& price_oracle);
  void detach(ledger::LendingPool& pool, oracle::PriceOracle& price_oracle);

  [[nodiscard]] bool healthy() const noexcept { return !failed_; }
  [[nodiscard]] const std::string& failure() const noexcept { return failure_; }
  [[nodiscard]] std::size_t appended() const noexcept { return appended_; }
  // Commits that took effect but are missing from the journal.
  [[nodiscard]] std::size_t dropped() const noexcept { return dropped_; }

 private:
  Appender appender_;
  bool failed_{false};
  std::string failure_{};
  std::size_t appended_{0};
  std::size_t dropped_{0};

  using PayloadEncoder = std::function<std::vector<std::byte>()>;
  void record(wal::RecordKind kind, const PayloadEncoder& encode_payload) noexcept;
};

// Writes the current state as the latest snapshot, covering journal records
// up to `sequence`.
void write_snapshot(snapshot::Store& store,
                    common::SequenceId sequence,
                    const ledger::LendingPool& pool,
                    const oracle::PriceOracle& price_oracle);

}  // namespace replay
}  // namespace lendcore
