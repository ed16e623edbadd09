#include "lendcore/wal/wal_writer.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <unistd.h>

namespace lendcore {
namespace wal {

namespace {
constexpr std::uint32_t kMagic = 0x4c43574c;  // 'LCWL'
constexpr std::uint16_t kVersion = 1;

std::uint32_t checksum32(std::span<const std::byte> data) noexcept {
  constexpr std::uint32_t kFnvPrime = 16777619u;
  std::uint32_t hash = 2166136261u;
  for (const auto& b : data) {
    hash ^= static_cast<std::uint8_t>(b);
    hash *= kFnvPrime;
  }
  return hash;
}

// Pushes buffered bytes through the OS cache to the device.
void fsync_file(std::FILE* file) {
  if (::fsync(fileno(file)) != 0) {
    throw std::system_error(errno, std::system_category(), "journal fsync failed");
  }
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, std::size_t flush_threshold_records)
    : buffer_(), flush_threshold_(flush_threshold_records == 0 ? 1 : flush_threshold_records) {
  ensure_open(path);
}

Writer::~Writer() {
  try {
    flush();
  } catch (const std::exception& ex) {
    spdlog::error("journal flush on close failed: {}", ex.what());
  }
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

void Writer::ensure_open(const std::filesystem::path& path) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  file_ = std::fopen(path.c_str(), "ab+");
  if (!file_) {
    throw std::runtime_error("failed to open journal: " + path.string());
  }
  if (std::fseek(file_, 0, SEEK_END) != 0) {
    throw std::runtime_error("failed to seek journal: " + path.string());
  }
  // Continue numbering after the last record already on disk.
  Reader reader(path);
  Record record;
  while (reader.next(record)) {
    next_sequence_ = record.header.sequence + 1;
  }
}

std::uint64_t Writer::append(const RecordView& record_view) {
  if (!file_) {
    throw std::runtime_error("journal writer not open");
  }

  RecordHeader header;
  header.magic = kMagic;
  header.version = kVersion;
  header.kind = record_view.kind;
  header.sequence = next_sequence_++;
  header.payload_size = static_cast<std::uint32_t>(record_view.payload.size());
  header.checksum = checksum32(record_view.payload);

  const auto header_bytes = std::as_bytes(std::span(&header, 1));
  buffer_.insert(buffer_.end(), header_bytes.begin(), header_bytes.end());
  buffer_.insert(buffer_.end(), record_view.payload.begin(), record_view.payload.end());

  if (++pending_ >= flush_threshold_) {
    flush();
  }
  return header.sequence;
}

void Writer::flush() {
  if (!file_ || buffer_.empty()) {
    return;
  }

  const auto wrote = std::fwrite(buffer_.data(), 1, buffer_.size(), file_);
  if (wrote != buffer_.size()) {
    throw std::runtime_error("failed to write journal buffer");
  }
  buffer_.clear();
  pending_ = 0;
  if (std::fflush(file_) != 0) {
    throw std::system_error(errno, std::system_category(), "journal fflush failed");
  }
}

void Writer::sync() {
  flush();
  if (!file_) {
    return;
  }
  fsync_file(file_);
}

Reader::Reader(const std::filesystem::path& path)
    : path_(path) {
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    throw std::runtime_error("failed to open journal for read: " + path.string());
  }
}

Reader::~Reader() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool Reader::next(Record& out_record) {
  if (!file_) {
    return false;
  }

  RecordHeader header;
  const auto read_header = std::fread(&header, 1, sizeof(RecordHeader), file_);
  if (read_header == 0) {
    return false;
  }
  if (read_header != sizeof(RecordHeader)) {
    throw std::runtime_error("truncated journal header in " + path_.string());
  }

  if (header.magic != kMagic) {
    throw std::runtime_error("invalid journal magic in " + path_.string());
  }
  if (header.version != kVersion) {
    throw std::runtime_error("unsupported journal version " + std::to_string(header.version));
  }

  out_record.header = header;
  out_record.payload.resize(header.payload_size);
  if (header.payload_size > 0) {
    const auto read_payload = std::fread(out_record.payload.data(), 1, header.payload_size, file_);
    if (read_payload != header.payload_size) {
      throw std::runtime_error("truncated journal record " + std::to_string(header.sequence));
    }
  }

  if (header.checksum != checksum32(out_record.payload)) {
    throw std::runtime_error("journal checksum mismatch at record " + std::to_string(header.sequence));
  }

  return true;
}

void Reader::seek_sequence(std::uint64_t sequence) {
  if (!file_) {
    return;
  }
  std::rewind(file_);
  Record record;
  while (next(record)) {
    if (record.header.sequence >= sequence) {
      const auto offset = static_cast<long>(sizeof(RecordHeader) + record.header.payload_size);
      if (std::fseek(file_, -offset, SEEK_CUR) != 0) {
        throw std::runtime_error("failed to seek in journal");
      }
      break;
    }
  }
}

}  // namespace wal
}  // namespace lendcore
