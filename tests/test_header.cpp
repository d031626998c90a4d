#include "core/errors.hpp"
#include "format/header.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace crush;

namespace {
const MagicNumber DEFLATE_MAGIC{0x43, 0x52, 0x01, 0x00};

std::string header_bytes(const CompressedHeader &header,
                         const std::optional<FileMetadata> &metadata) {
  std::ostringstream out(std::ios::binary);
  write_header(out, header, metadata);
  return out.str();
}

ParsedHeader read_header(std::istream &in) {
  return read_metadata_block(in, read_fixed_header(in));
}
} // namespace

TEST(HeaderTest, FixedLayoutIsLittleEndian) {
  CompressedHeader header;
  header.magic = DEFLATE_MAGIC;
  header.original_size = 0x0102030405060708ULL;
  header.flags = CompressedHeader::FLAG_HAS_CRC32;
  header.crc32 = 0xCBF43926;

  auto bytes = header.to_bytes();
  ASSERT_EQ(bytes.size(), 20u);
  EXPECT_EQ(bytes[0], 0x43);
  EXPECT_EQ(bytes[1], 0x52);
  EXPECT_EQ(bytes[2], 0x01);
  EXPECT_EQ(bytes[3], 0x00);
  EXPECT_EQ(bytes[4], 0x08);
  EXPECT_EQ(bytes[11], 0x01);
  EXPECT_EQ(bytes[12], CompressedHeader::FLAG_HAS_CRC32);
  EXPECT_EQ(bytes[13], 0);
  EXPECT_EQ(bytes[14], 0);
  EXPECT_EQ(bytes[15], 0);
  EXPECT_EQ(bytes[16], 0x26);
  EXPECT_EQ(bytes[19], 0xCB);

  auto parsed = CompressedHeader::from_bytes(bytes.data(), bytes.size());
  EXPECT_EQ(parsed.magic, header.magic);
  EXPECT_EQ(parsed.original_size, header.original_size);
  EXPECT_TRUE(parsed.has_crc32());
  EXPECT_FALSE(parsed.has_metadata());
  EXPECT_EQ(parsed.crc32, header.crc32);
}

TEST(HeaderTest, ShortInputIsInvalidHeader) {
  uint8_t bytes[10] = {0x43, 0x52, 0x01, 0x00};
  try {
    CompressedHeader::from_bytes(bytes, sizeof(bytes));
    FAIL() << "Expected InvalidHeader";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidHeader);
  }
}

TEST(HeaderTest, AnyMagicParses) {
  CompressedHeader header;
  header.magic = {'Z', 'S', 'T', 'D'};
  header.original_size = 99;
  auto bytes = header.to_bytes();
  auto parsed = CompressedHeader::from_bytes(bytes.data(), bytes.size());
  EXPECT_EQ(parsed.magic, header.magic);
  EXPECT_EQ(parsed.original_size, 99u);
  EXPECT_FALSE(parsed.has_crush_prefix());

  header.magic = DEFLATE_MAGIC;
  EXPECT_TRUE(header.has_crush_prefix());
  header.magic = {0x43, 0x52, 0x02, 0x00};
  EXPECT_FALSE(header.has_crush_prefix());
}

TEST(HeaderTest, ForeignMagicKeepsDiagnostics) {
  CompressedHeader header;
  header.magic = {'P', 'K', 0x03, 0x04};
  header.original_size = 1234;
  try {
    throw_unregistered_magic(header);
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnrecognizedFormat);
    EXPECT_NE(std::string(e.what()).find("Not a crush file"),
              std::string::npos);
    ASSERT_TRUE(e.header().has_value());
    EXPECT_EQ(e.header()->original_size, 1234u);
    EXPECT_EQ(e.header()->magic[0], 'P');
  }
}

TEST(HeaderTest, UnsupportedVersionIsInvalidHeader) {
  CompressedHeader header;
  header.magic = {0x43, 0x52, 0x02, 0x00};
  try {
    throw_unregistered_magic(header);
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidHeader);
    EXPECT_TRUE(e.header().has_value());
  }
}

TEST(HeaderTest, MissingAlgorithmIsUnrecognizedFormat) {
  CompressedHeader header;
  header.magic = {0x43, 0x52, 0x01, 0x7f};
  try {
    throw_unregistered_magic(header);
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnrecognizedFormat);
    EXPECT_NE(std::string(e.what()).find("43 52 01 7f"), std::string::npos);
  }
}

TEST(HeaderTest, MetadataBlockFollowsHeader) {
  CompressedHeader header;
  header.magic = DEFLATE_MAGIC;
  header.original_size = 42;
  header.flags = CompressedHeader::FLAG_HAS_CRC32;

  FileMetadata metadata;
  metadata.mtime = 1700000000;
  metadata.permissions = 0644;

  const std::string encoded = header_bytes(header, metadata);
  // 20 + u16 length + (2 + 8) + (2 + 4)
  EXPECT_EQ(encoded.size(), 20u + 2u + 10u + 6u);
  EXPECT_EQ(static_cast<uint8_t>(encoded[12]),
            CompressedHeader::FLAG_HAS_CRC32 |
                CompressedHeader::FLAG_HAS_METADATA);

  std::istringstream in(encoded, std::ios::binary);
  ParsedHeader parsed = read_header(in);
  EXPECT_EQ(parsed.encoded_size, encoded.size());
  ASSERT_TRUE(parsed.metadata.has_value());
  EXPECT_EQ(*parsed.metadata, metadata);
}

TEST(HeaderTest, EmptyMetadataClearsFlag) {
  CompressedHeader header;
  header.magic = DEFLATE_MAGIC;
  header.flags = CompressedHeader::FLAG_HAS_METADATA;

  const std::string encoded = header_bytes(header, FileMetadata{});
  EXPECT_EQ(encoded.size(), CompressedHeader::SIZE);
  EXPECT_EQ(static_cast<uint8_t>(encoded[12]), 0);

  std::istringstream in(encoded, std::ios::binary);
  ParsedHeader parsed = read_header(in);
  EXPECT_FALSE(parsed.metadata.has_value());
  EXPECT_EQ(parsed.encoded_size, CompressedHeader::SIZE);
}

TEST(HeaderTest, TruncatedMetadataIsInvalidHeader) {
  CompressedHeader header;
  header.magic = DEFLATE_MAGIC;
  header.original_size = 7;
  FileMetadata metadata;
  metadata.mtime = 1;

  std::string encoded = header_bytes(header, metadata);
  encoded.resize(encoded.size() - 3);

  std::istringstream in(encoded, std::ios::binary);
  try {
    read_header(in);
    FAIL() << "Expected InvalidHeader";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidHeader);
    ASSERT_TRUE(e.header().has_value());
    EXPECT_EQ(e.header()->original_size, 7u);
  }
}

TEST(FileMetadataTest, UnknownRecordsAreSkipped) {
  const uint8_t block[] = {
      0x7f, 0x03, 0xaa, 0xbb, 0xcc,             // unknown type
      0x02, 0x04, 0xed, 0x01, 0x00, 0x00};      // permissions 0755
  FileMetadata metadata = FileMetadata::from_bytes(block, sizeof(block));
  EXPECT_FALSE(metadata.mtime.has_value());
  ASSERT_TRUE(metadata.permissions.has_value());
  EXPECT_EQ(*metadata.permissions, 0755u);
}

TEST(FileMetadataTest, WrongLengthIsRejected) {
  const uint8_t block[] = {0x01, 0x04, 0x00, 0x00, 0x00, 0x00};
  EXPECT_THROW(FileMetadata::from_bytes(block, sizeof(block)), CrushError);

  const uint8_t dangling[] = {0x02};
  EXPECT_THROW(FileMetadata::from_bytes(dangling, sizeof(dangling)),
               CrushError);
}

TEST(FileMetadataTest, NegativeMtimeSurvives) {
  FileMetadata metadata;
  metadata.mtime = -86400;
  auto bytes = metadata.to_bytes();
  EXPECT_EQ(FileMetadata::from_bytes(bytes.data(), bytes.size()), metadata);
}

TEST(Crc32Test, KnownVector) {
  const std::string check = "123456789";
  EXPECT_EQ(compute_crc32(reinterpret_cast<const uint8_t *>(check.data()),
                          check.size()),
            0xCBF43926u);
  EXPECT_EQ(compute_crc32(std::vector<uint8_t>{}), 0u);
}

TEST(Crc32Test, IncrementalMatchesOneShot) {
  auto data = crush::test::random_bytes(100000);
  uint32_t first = compute_crc32(data.data(), 40000);
  uint32_t both = compute_crc32(data.data() + 40000, 60000, first);
  EXPECT_EQ(both, compute_crc32(data));
}
