#include "lendcore/replay/replay_driver.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "lendcore/replay/state_codec.hpp"

namespace lendcore {
namespace replay {

Driver::Driver() = default;

void Driver::configure(std::filesystem::path snapshot_directory, std::filesystem::path wal_path) {
  snapshot_store_.prepare(snapshot_directory);
  wal_path_ = std::move(wal_path);
}

void Driver::set_snapshot_handler(SnapshotHandler handler) {
  snapshot_handler_ = std::move(handler);
}

void Driver::set_record_handler(RecordHandler handler) {
  record_handler_ = std::move(handler);
}

common::SequenceId Driver::execute() {
  if (!record_handler_) {
    throw std::runtime_error("record handler not set for replay");
  }

  common::SequenceId last{0};

  if (auto snap = snapshot_store_.latest()) {
    last = snap->sequence;
    if (snapshot_handler_) {
      snapshot_handler_(snap->sequence, std::span<const std::byte>(snap->payload.data(), snap->payload.size()));
    }
  }

  if (!std::filesystem::exists(wal_path_)) {
    return last;
  }

  wal::Reader reader(wal_path_);
  reader.seek_sequence(last + 1);
  wal::Record record;
  while (reader.next(record)) {
    if (record.header.sequence <= last) {
      continue;
    }
    record_handler_(record);
    last = record.header.sequence;
  }
  return last;
}

RecoveryStats recover(const std::filesystem::path& snapshot_directory,
                      const std::filesystem::path& wal_path,
                      ledger::LendingPool& pool,
                      oracle::PriceOracle& price_oracle) {
  RecoveryStats stats;

  Driver driver;
  driver.configure(snapshot_directory, wal_path);
  driver.set_snapshot_handler([&](common::SequenceId sequence, std::span<const std::byte> payload) {
    const LedgerImage image = decode_ledger_image(payload);
    pool.restore(image.pool);
    price_oracle.restore(image.oracle);
    stats.snapshot_loaded = true;
    stats.snapshot_sequence = sequence;
  });
  driver.set_record_handler([&](const wal::Record& record) {
    switch (record.header.kind) {
      case wal::RecordKind::kLedgerCommit:
        pool.apply(decode_ledger_commit(record.payload));
        ++stats.ledger_records;
        break;
      case wal::RecordKind::kOracleCommit:
        price_oracle.apply(decode_oracle_commit(record.payload));
        ++stats.oracle_records;
        break;
      default:
        throw std::runtime_error("unknown journal record kind " +
                                 std::to_string(static_cast<unsigned>(record.header.kind)));
    }
  });
  stats.last_sequence = driver.execute();

  spdlog::info("recovered state: snapshot={} (seq {}), ledger records={}, oracle records={}, last seq={}",
               stats.snapshot_loaded, stats.snapshot_sequence, stats.ledger_records, stats.oracle_records,
               stats.last_sequence);
  return stats;
}

CommitJournal::CommitJournal(wal::Writer& writer)
    : appender_([&writer](const wal::RecordView& view) { return writer.append(view); }) {}

CommitJournal::CommitJournal(Appender appender) : appender_(std::move(appender)) {}

void CommitJournal::attach(ledger::LendingPool& pool, oracle::PriceOracle& price_oracle) {
  pool.set_commit_hook([this](const ledger::CommitRecord& commit) noexcept {
    record(wal::RecordKind::kLedgerCommit, [&commit] { return encode(commit); });
  });
  price_oracle.set_commit_hook([this](const oracle::OracleCommit& commit) noexcept {
    record(wal::RecordKind::kOracleCommit, [&commit] { return encode(commit); });
  });
}

void CommitJournal::detach(ledger::LendingPool& pool, oracle::PriceOracle& price_oracle) {
  pool.set_commit_hook({});
  price_oracle.set_commit_hook({});
}

void CommitJournal::record(wal::RecordKind kind, const PayloadEncoder& encode_payload) noexcept {
  if (failed_) {
    ++dropped_;
    spdlog::critical("journal unavailable ({}), commit not recorded; {} dropped so far", failure_, dropped_);
    return;
  }
  try {
    const auto payload = encode_payload();
    appender_({.kind = kind, .payload = payload});
    ++appended_;
  } catch (const std::exception& ex) {
    failed_ = true;
    failure_ = ex.what();
    ++dropped_;
    spdlog::critical("journal append failed after {} records: {}", appended_, failure_);
  }
}

void write_snapshot(snapshot::Store& store,
                    common::SequenceId sequence,
                    const ledger::LendingPool& pool,
                    const oracle::PriceOracle& price_oracle) {
  const auto payload = encode(LedgerImage{.pool = pool.export_image(), .oracle = price_oracle.export_image()});
  store.persist(sequence, payload);
  spdlog::info("snapshot written at seq {} ({} bytes)", sequence, payload.size());
}

}  // namespace replay
}  // namespace lendcore
