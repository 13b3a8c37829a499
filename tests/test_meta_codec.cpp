#include <stdexcept>
#include <string>
#include <vector>

#include <sgax/archive_codec.hpp>
#include <sgax/codecs.hpp>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace sgax_test;

namespace {

std::vector<uint8_t> metaBytes(uint32_t reserved0, uint32_t reserved1,
                               std::string_view name = "EngineArtHigh") {
  std::vector<uint8_t> out;
  putUtf16(out, name, 128);
  putU64(out, 0x0E59);
  putU32(out, 0x03B1);
  putU64(out, 0x01AC);
  putU32(out, 0x0CAD);
  putU32(out, reserved0);
  putU32(out, reserved1);
  auto hash = sampleHash();
  out.insert(out.end(), hash.begin(), hash.end());
  return out;
}

} // namespace

class MetaBlockCodecTest : public ::testing::Test {
protected:
  const sgax::MetaBlockCodec &codec() const { return v10_.parts().meta; }

  sgax::MetaBlock decode(const std::vector<uint8_t> &bytes) const {
    sgax::ByteReader stream(bytes);
    return codec().decode(stream);
  }

  std::vector<uint8_t> encode(const sgax::MetaBlock &meta) const {
    sgax::ByteWriter stream;
    codec().encode(stream, meta);
    return stream.release();
  }

  sgax::ArchiveCodec v10_ = sgax::ArchiveCodec::makeV10();
};

TEST_F(MetaBlockCodecTest, LayoutIs416Bytes) {
  EXPECT_EQ(codec().layout().size(), 416u);
}

TEST_F(MetaBlockCodecTest, DecodesHeader) {
  auto bytes = metaBytes(0, 1);
  ASSERT_EQ(bytes.size(), 416u);

  auto meta = decode(bytes);
  EXPECT_EQ(meta.name, "EngineArtHigh");
  EXPECT_EQ(meta.ptrs.headerPos, 0x0E59u);
  EXPECT_EQ(meta.ptrs.headerSize, 0x03B1u);
  EXPECT_EQ(meta.ptrs.dataPos, 0x01ACu);
  EXPECT_EQ(meta.ptrs.dataSize, 0x0CADu);
  EXPECT_EQ(meta.sha256, sampleHash());

  EXPECT_EQ(encode(meta), bytes);
}

TEST_F(MetaBlockCodecTest, ReservedMismatchCarriesObservedAndExpected) {
  const std::pair<uint32_t, uint32_t> bad[] = {{1, 1}, {0, 0}, {1, 0}, {0, 2}, {0xFFFFFFFF, 1}};

  for (auto [rsv0, rsv1] : bad) {
    try {
      decode(metaBytes(rsv0, rsv1));
      FAIL() << "Expected FormatMismatchError for (" << rsv0 << ", " << rsv1 << ")";
    } catch (const sgax::FormatMismatchError &e) {
      EXPECT_EQ(e.field(), "Reserved Flags");
      EXPECT_EQ(e.observed(), "(" + std::to_string(rsv0) + ", " + std::to_string(rsv1) + ")");
      EXPECT_EQ(e.expected(), "(0, 1)");
    }
  }
}

TEST_F(MetaBlockCodecTest, ReservedMismatchIsAParseError) {
  EXPECT_THROW(decode(metaBytes(0, 2)), sgax::ParseError);
}

TEST_F(MetaBlockCodecTest, EncodeAlwaysWritesReservedConstants) {
  sgax::MetaBlock meta;
  meta.name = "x";
  auto bytes = encode(meta);
  ASSERT_EQ(bytes.size(), 416u);

  // reserved0 at 152, reserved1 at 156
  EXPECT_EQ(bytes[152], 0);
  EXPECT_EQ(bytes[156], 1);
  EXPECT_EQ(bytes[157], 0);
  EXPECT_NO_THROW(decode(bytes));
}

TEST_F(MetaBlockCodecTest, ShortHashIsZeroPadded) {
  sgax::MetaBlock meta;
  meta.sha256 = {0xAA, 0xBB};
  auto decoded = decode(encode(meta));
  ASSERT_EQ(decoded.sha256.size(), 256u);
  EXPECT_EQ(decoded.sha256[0], 0xAA);
  EXPECT_EQ(decoded.sha256[1], 0xBB);
  EXPECT_EQ(decoded.sha256[2], 0x00);
}

TEST_F(MetaBlockCodecTest, NonAsciiNameRoundTrips) {
  sgax::MetaBlock meta = sgax::MetaBlock::makeDefault();
  meta.name = "Arch\xC3\xA4ologie \xF0\x9F\x8E\xAE"; // "Archäologie" + U+1F3AE
  meta.ptrs = {1, 2, 3, 4};

  auto bytes = encode(meta);
  // 'ä' is one UTF-16 unit, U+1F3AE a surrogate pair
  EXPECT_EQ(bytes[8], 0xE4);
  EXPECT_EQ(bytes[9], 0x00);
  EXPECT_EQ(decode(bytes), meta);
}

TEST_F(MetaBlockCodecTest, NameLongerThanFieldIsRejected) {
  sgax::MetaBlock meta;
  meta.name = std::string(64, 'a');
  EXPECT_NO_THROW(encode(meta));

  meta.name = std::string(65, 'a');
  EXPECT_THROW(encode(meta), std::length_error);
}

TEST_F(MetaBlockCodecTest, InvalidUtf16NameIsRejected) {
  auto bytes = metaBytes(0, 1);
  // Lone trail surrogate as the first character
  bytes[0] = 0x00;
  bytes[1] = 0xDC;
  EXPECT_THROW(decode(bytes), sgax::ParseError);
}

TEST_F(MetaBlockCodecTest, DefaultMetaBlockIsPlaceholder) {
  auto meta = sgax::MetaBlock::makeDefault();
  EXPECT_EQ(meta.name, "Default Meta Block");
  EXPECT_EQ(meta.ptrs, sgax::ArchivePtrs{});

  ASSERT_EQ(meta.sha256.size(), sgax::MetaBlock::hashSize);
  const std::string pattern = "default hash.   ";
  for (size_t i = 0; i < meta.sha256.size(); ++i) {
    ASSERT_EQ(meta.sha256[i], static_cast<uint8_t>(pattern[i % pattern.size()])) << "at " << i;
  }

  EXPECT_EQ(decode(encode(meta)), meta);
}
