#ifndef CRUSH_HEADER_HPP
#define CRUSH_HEADER_HPP

#include "core/errors.hpp"
#include "plugin/algorithm.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <vector>

namespace crush {

// Original file attributes carried in the optional TLV block.
struct FileMetadata {
  static constexpr uint8_t TYPE_MTIME = 0x01;       // i64 LE, unix seconds
  static constexpr uint8_t TYPE_PERMISSIONS = 0x02; // u32 LE, POSIX mode bits

  std::optional<int64_t> mtime;
  std::optional<uint32_t> permissions;

  bool empty() const { return !mtime && !permissions; }

  std::vector<uint8_t> to_bytes() const;

  // Unknown record types are skipped. Throws CrushError(InvalidHeader) on a
  // truncated record or a known type with the wrong length.
  static FileMetadata from_bytes(const uint8_t *data, size_t len);

  bool operator==(const FileMetadata &other) const {
    return mtime == other.mtime && permissions == other.permissions;
  }
};

// Fixed 20-byte little-endian header:
//   0..4   magic
//   4..12  original_size (u64)
//   12     flags
//   13..16 reserved, zero
//   16..20 crc32 of the original data (u32)
// When FLAG_HAS_METADATA is set, a u16 length and that many TLV bytes follow.
struct CompressedHeader {
  static constexpr size_t SIZE = 20;
  static constexpr uint8_t FLAG_HAS_CRC32 = 0x01;
  static constexpr uint8_t FLAG_HAS_METADATA = 0x02;

  MagicNumber magic{};
  uint64_t original_size = 0;
  uint8_t flags = 0;
  uint32_t crc32 = 0;

  bool has_crc32() const { return (flags & FLAG_HAS_CRC32) != 0; }
  bool has_metadata() const { return (flags & FLAG_HAS_METADATA) != 0; }

  std::array<uint8_t, SIZE> to_bytes() const;

  // Structural parse only; any magic is accepted so that algorithms linked
  // in with their own magic numbers can read their files back. Throws
  // InvalidHeader if fewer than SIZE bytes are given.
  static CompressedHeader from_bytes(const uint8_t *data, size_t len);

  // True for the built-in "CR" prefix at the current format version.
  bool has_crush_prefix() const;

  HeaderDiagnostics diagnostics() const;
};

struct ParsedHeader {
  CompressedHeader header;
  std::optional<FileMetadata> metadata;
  // Header plus metadata block
  size_t encoded_size = CompressedHeader::SIZE;
};

// Writes the header and, if `metadata` is non-empty, the metadata block. The
// HAS_METADATA flag is set or cleared to match. Returns bytes written.
size_t write_header(std::ostream &out, CompressedHeader header,
                    const std::optional<FileMetadata> &metadata);

// Reads the fixed 20 bytes.
CompressedHeader read_fixed_header(std::istream &in);

// Reads the metadata block that follows `header`, if its flag is set.
ParsedHeader read_metadata_block(std::istream &in,
                                 const CompressedHeader &header);

// Explains why a magic number that no registered algorithm claims cannot be
// decoded: UnrecognizedFormat for foreign data, InvalidHeader for a crush
// file of another format version, UnrecognizedFormat for a crush file whose
// algorithm is not linked in. Always throws.
[[noreturn]] void throw_unregistered_magic(const CompressedHeader &header);

uint32_t compute_crc32(const uint8_t *data, size_t len, uint32_t crc = 0);

inline uint32_t compute_crc32(const std::vector<uint8_t> &data) {
  return compute_crc32(data.data(), data.size());
}

} // namespace crush

#endif // CRUSH_HEADER_HPP
