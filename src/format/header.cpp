#include "format/header.hpp"
#include "core/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <string>

namespace crush {

namespace {

template <typename T> void put_le(uint8_t *out, T value) {
  for (size_t i = 0; i < sizeof(T); ++i)
    out[i] = static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i));
}

template <typename T> T get_le(const uint8_t *in) {
  uint64_t value = 0;
  for (size_t i = 0; i < sizeof(T); ++i)
    value |= static_cast<uint64_t>(in[i]) << (8 * i);
  return static_cast<T>(value);
}

void append_record(std::vector<uint8_t> &out, uint8_t type,
                   const uint8_t *value, uint8_t len) {
  out.push_back(type);
  out.push_back(len);
  out.insert(out.end(), value, value + len);
}

} // namespace

std::vector<uint8_t> FileMetadata::to_bytes() const {
  std::vector<uint8_t> out;
  if (mtime) {
    uint8_t value[8];
    put_le<int64_t>(value, *mtime);
    append_record(out, TYPE_MTIME, value, sizeof(value));
  }
  if (permissions) {
    uint8_t value[4];
    put_le<uint32_t>(value, *permissions);
    append_record(out, TYPE_PERMISSIONS, value, sizeof(value));
  }
  return out;
}

FileMetadata FileMetadata::from_bytes(const uint8_t *data, size_t len) {
  FileMetadata metadata;
  size_t i = 0;
  while (i < len) {
    if (i + 2 > len)
      throw CrushError(ErrorKind::InvalidHeader, "Incomplete metadata record");

    uint8_t type = data[i];
    size_t length = data[i + 1];
    i += 2;
    if (i + length > len)
      throw CrushError(ErrorKind::InvalidHeader, "Incomplete metadata value");

    const uint8_t *value = data + i;
    i += length;

    switch (type) {
    case TYPE_MTIME:
      if (length != 8)
        throw CrushError(ErrorKind::InvalidHeader, "Invalid mtime length");
      metadata.mtime = get_le<int64_t>(value);
      break;
    case TYPE_PERMISSIONS:
      if (length != 4)
        throw CrushError(ErrorKind::InvalidHeader, "Invalid permissions length");
      metadata.permissions = get_le<uint32_t>(value);
      break;
    default:
      LOG(LogLevel::DEBUG, LogComponent::FORMAT,
          "Skipping unknown metadata record type " << static_cast<int>(type));
      break;
    }
  }
  return metadata;
}

std::array<uint8_t, CompressedHeader::SIZE> CompressedHeader::to_bytes() const {
  std::array<uint8_t, SIZE> bytes{};
  std::copy(magic.begin(), magic.end(), bytes.begin());
  put_le<uint64_t>(bytes.data() + 4, original_size);
  bytes[12] = flags;
  // 13..16 reserved
  put_le<uint32_t>(bytes.data() + 16, crc32);
  return bytes;
}

CompressedHeader CompressedHeader::from_bytes(const uint8_t *data, size_t len) {
  if (len < SIZE) {
    throw CrushError(ErrorKind::InvalidHeader,
                     "Input too short for a crush header: " +
                         std::to_string(len) + " of " + std::to_string(SIZE) +
                         " bytes");
  }

  CompressedHeader header;
  std::copy(data, data + 4, header.magic.begin());
  header.original_size = get_le<uint64_t>(data + 4);
  header.flags = data[12];
  header.crc32 = get_le<uint32_t>(data + 16);
  return header;
}

bool CompressedHeader::has_crush_prefix() const {
  return magic[0] == MAGIC_PREFIX_0 && magic[1] == MAGIC_PREFIX_1 &&
         magic[2] == FORMAT_VERSION;
}

void throw_unregistered_magic(const CompressedHeader &header) {
  if (header.magic[0] != MAGIC_PREFIX_0 || header.magic[1] != MAGIC_PREFIX_1) {
    throw CrushError(ErrorKind::UnrecognizedFormat,
                     "Not a crush file (magic " +
                         magic_to_string(header.magic) + ")",
                     header.diagnostics());
  }
  if (header.magic[2] != FORMAT_VERSION) {
    throw CrushError(ErrorKind::InvalidHeader,
                     "Unsupported format version " +
                         std::to_string(header.magic[2]),
                     header.diagnostics());
  }
  throw CrushError(ErrorKind::UnrecognizedFormat,
                   "No registered algorithm for magic number " +
                       magic_to_string(header.magic) +
                       " (the algorithm that produced this file is not "
                       "available)",
                   header.diagnostics());
}

HeaderDiagnostics CompressedHeader::diagnostics() const {
  HeaderDiagnostics diag;
  diag.magic = magic;
  diag.original_size = original_size;
  diag.stored_crc32 = crc32;
  diag.has_crc32 = has_crc32();
  return diag;
}

size_t write_header(std::ostream &out, CompressedHeader header,
                    const std::optional<FileMetadata> &metadata) {
  std::vector<uint8_t> metadata_bytes;
  if (metadata && !metadata->empty())
    metadata_bytes = metadata->to_bytes();

  if (metadata_bytes.empty())
    header.flags &= static_cast<uint8_t>(~CompressedHeader::FLAG_HAS_METADATA);
  else
    header.flags |= CompressedHeader::FLAG_HAS_METADATA;

  auto bytes = header.to_bytes();
  out.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  size_t written = bytes.size();

  if (!metadata_bytes.empty()) {
    uint8_t len[2];
    put_le<uint16_t>(len, static_cast<uint16_t>(metadata_bytes.size()));
    out.write(reinterpret_cast<const char *>(len), sizeof(len));
    out.write(reinterpret_cast<const char *>(metadata_bytes.data()),
              static_cast<std::streamsize>(metadata_bytes.size()));
    written += sizeof(len) + metadata_bytes.size();
  }

  if (!out)
    throw CrushError(ErrorKind::Io, "Failed to write crush header");
  return written;
}

CompressedHeader read_fixed_header(std::istream &in) {
  std::array<uint8_t, CompressedHeader::SIZE> bytes{};
  in.read(reinterpret_cast<char *>(bytes.data()), bytes.size());
  if (in.bad())
    throw CrushError(ErrorKind::Io, "Failed to read crush header");

  return CompressedHeader::from_bytes(bytes.data(),
                                      static_cast<size_t>(in.gcount()));
}

ParsedHeader read_metadata_block(std::istream &in,
                                 const CompressedHeader &header) {
  ParsedHeader parsed;
  parsed.header = header;

  if (header.has_metadata()) {
    uint8_t len_bytes[2];
    in.read(reinterpret_cast<char *>(len_bytes), sizeof(len_bytes));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(len_bytes)))
      throw CrushError(ErrorKind::InvalidHeader,
                       "Truncated metadata length", header.diagnostics());

    uint16_t len = get_le<uint16_t>(len_bytes);
    std::vector<uint8_t> block(len);
    in.read(reinterpret_cast<char *>(block.data()), len);
    if (in.gcount() != static_cast<std::streamsize>(len))
      throw CrushError(ErrorKind::InvalidHeader, "Truncated metadata block",
                       header.diagnostics());

    try {
      parsed.metadata = FileMetadata::from_bytes(block.data(), block.size());
    } catch (const CrushError &e) {
      throw CrushError(e.kind(), e.what(), header.diagnostics());
    }
    parsed.encoded_size += sizeof(len_bytes) + len;
  }
  return parsed;
}

uint32_t compute_crc32(const uint8_t *data, size_t len, uint32_t crc) {
  uLong value = crc;
  while (len > 0) {
    uInt chunk = static_cast<uInt>(
        std::min<size_t>(len, std::numeric_limits<uInt>::max()));
    value = ::crc32(value, data, chunk);
    data += chunk;
    len -= chunk;
  }
  return static_cast<uint32_t>(value);
}

} // namespace crush
