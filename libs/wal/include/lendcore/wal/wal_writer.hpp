#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <vector>

namespace lendcore {
namespace wal {

enum class RecordKind : std::uint16_t {
  kLedgerCommit = 1,
  kOracleCommit = 2,
};

struct RecordHeader {
  std::uint32_t magic{0x4c43574c};  // 'LCWL'
  std::uint16_t version{1};
  RecordKind kind{RecordKind::kLedgerCommit};
  std::uint64_t sequence{0};
  std::uint32_t payload_size{0};
  std::uint32_t checksum{0};
};

struct RecordView {
  RecordKind kind{RecordKind::kLedgerCommit};
  std::span<const std::byte> payload{};
};

struct Record {
  RecordHeader header{};
  std::vector<std::byte> payload{};
};

// Append-only journal. Records are buffered and written once
// `flush_threshold_records` are pending, on flush() or on destruction.
class Writer {
 public:
  explicit Writer(const std::filesystem::path& path, std::size_t flush_threshold_records = 128);
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;
  Writer(Writer&&) = delete;
  Writer& operator=(Writer&&) = delete;
  ~Writer();

  // Returns the sequence assigned to the record.
  std::uint64_t append(const RecordView& record);
  void flush();
  void sync();
  [[nodiscard]] std::uint64_t next_sequence() const noexcept { return next_sequence_; }

 private:
  std::FILE* file_{nullptr};
  std::vector<std::byte> buffer_{};
  std::size_t pending_{0};
  std::size_t flush_threshold_;
  std::uint64_t next_sequence_{1};

  void ensure_open(const std::filesystem::path& path);
};

class Reader {
 public:
  explicit Reader(const std::filesystem::path& path);
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;
  Reader(Reader&&) = delete;
  Reader& operator=(Reader&&) = delete;
  ~Reader();

  // False at a clean end of file. Throws std::runtime_error on a bad magic,
  // a truncated record or a checksum mismatch.
  bool next(Record& out_record);
  // Positions the reader on the first record with sequence >= `sequence`.
  void seek_sequence(std::uint64_t sequence);

 private:
  std::FILE* file_{nullptr};
  std::filesystem::path path_{};
};

}  // namespace wal
}  // namespace lendcore
