#include <string>
#include <vector>

#include <sgax/metadata.hpp>
#include <sgax/text.hpp>

#include <gtest/gtest.h>

#include "test_support.hpp"

namespace {

sgax::MetaBlock sampleMeta() {
  sgax::MetaBlock meta;
  meta.name = "EngineArtHigh";
  meta.ptrs = {440, 297, 428, 12};
  meta.sha256 = sgax_test::sampleHash();
  return meta;
}

} // namespace

TEST(MetadataTest, AssembleUsesHexHashAndFooterFields) {
  auto metadata = sgax::assembleMeta(sampleMeta(), {0x11, 0x22, 0x4000});

  ASSERT_EQ(metadata.sha256Hex.size(), 512u);
  EXPECT_EQ(metadata.sha256Hex.substr(0, 6), "030a11"); // 3, 10, 17
  EXPECT_EQ(metadata.unkA, 0x11u);
  EXPECT_EQ(metadata.unkB, 0x22u);
  EXPECT_EQ(metadata.blockSize, 0x4000u);
}

TEST(MetadataTest, DisassembleInvertsAssemble) {
  sgax::TocFooter footer{7, 0xFFFFFFFF, 0x4000};
  auto [meta, decodedFooter] = sgax::disassembleMeta(sgax::assembleMeta(sampleMeta(), footer));

  EXPECT_EQ(decodedFooter, footer);
  EXPECT_EQ(meta.sha256, sgax_test::sampleHash());

  // Name and pointers are supplied by the writer, not by the metadata
  EXPECT_TRUE(meta.name.empty());
  EXPECT_EQ(meta.ptrs, sgax::ArchivePtrs{});
}

TEST(MetadataTest, ArchivePropertiesUseInterfaceKeys) {
  auto metadata = sgax::assembleMeta(sampleMeta(), {1, 2, 3});
  auto properties = metadata.toProperties();

  ASSERT_EQ(properties.size(), 4u);
  EXPECT_EQ(std::get<std::string>(properties.at("sha_256")), metadata.sha256Hex);
  EXPECT_EQ(std::get<uint64_t>(properties.at("unk_a")), 1u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("unk_b")), 2u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("block_size")), 3u);

  EXPECT_EQ(sgax::ArchiveMetadata::fromProperties(properties), metadata);
}

TEST(MetadataTest, ArchivePropertiesAreValidated) {
  auto properties = sgax::assembleMeta(sampleMeta(), {1, 2, 3}).toProperties();

  auto missing = properties;
  missing.erase("unk_b");
  EXPECT_THROW(sgax::ArchiveMetadata::fromProperties(missing), sgax::ParseError);

  auto wrongType = properties;
  wrongType["sha_256"] = uint64_t{5};
  EXPECT_THROW(sgax::ArchiveMetadata::fromProperties(wrongType), sgax::ParseError);

  auto outOfRange = properties;
  outOfRange["block_size"] = uint64_t{0x100000000ull};
  EXPECT_THROW(sgax::ArchiveMetadata::fromProperties(outOfRange), sgax::ParseError);
}

TEST(MetadataTest, BadHexHashIsRejected) {
  sgax::ArchiveMetadata metadata;
  metadata.sha256Hex = "abc";
  EXPECT_THROW(sgax::disassembleMeta(metadata), sgax::ParseError);

  metadata.sha256Hex = "zz";
  EXPECT_THROW(sgax::disassembleMeta(metadata), sgax::ParseError);
}

TEST(MetadataTest, FileMetadataRoundTrip) {
  sgax::FileDef def;
  def.namePos = 15;
  def.hashPos = 0x40;
  def.dataPos = 5;
  def.lengthInArchive = 7;
  def.lengthOnDisk = 9;
  def.verification = sgax::VerificationType::Md5Blocks;
  def.storage = sgax::StorageType::BufferCompress;
  def.encryption = sgax::EncryptionType::Aes128;
  def.crc = 0xDEADBEEF;

  auto metadata = sgax::buildFileMeta(def);
  auto properties = metadata.toProperties();
  ASSERT_EQ(properties.size(), 5u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("storage_type")), 1u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("verification_type")), 3u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("encryption_type")), 1u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("hash_pos")), 0x40u);
  EXPECT_EQ(std::get<uint64_t>(properties.at("crc")), 0xDEADBEEFu);

  auto rebuilt = sgax::fileMetaToDef(sgax::FileMetadata::fromProperties(properties));
  EXPECT_EQ(rebuilt.storage, def.storage);
  EXPECT_EQ(rebuilt.verification, def.verification);
  EXPECT_EQ(rebuilt.encryption, def.encryption);
  EXPECT_EQ(rebuilt.hashPos, def.hashPos);
  EXPECT_EQ(rebuilt.crc, def.crc);

  // Layout-dependent fields are not carried by metadata
  EXPECT_EQ(rebuilt.namePos, 0u);
  EXPECT_EQ(rebuilt.dataPos, 0u);
  EXPECT_EQ(rebuilt.lengthInArchive, 0u);
  EXPECT_EQ(rebuilt.lengthOnDisk, 0u);
}

TEST(MetadataTest, FileMetadataRejectsUnknownEnumValues) {
  auto properties = sgax::FileMetadata{}.toProperties();

  auto badStorage = properties;
  badStorage["storage_type"] = uint64_t{3};
  EXPECT_THROW(sgax::FileMetadata::fromProperties(badStorage), sgax::DomainError);

  auto badEncryption = properties;
  badEncryption["encryption_type"] = uint64_t{2};
  EXPECT_THROW(sgax::FileMetadata::fromProperties(badEncryption), sgax::DomainError);

  auto badVerification = properties;
  badVerification["verification_type"] = uint64_t{9};
  EXPECT_THROW(sgax::FileMetadata::fromProperties(badVerification), sgax::DomainError);
}

TEST(MetadataTest, HexHelpers) {
  const std::vector<uint8_t> bytes = {0x00, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(sgax::toHex(bytes), "007fabff");
  EXPECT_EQ(sgax::fromHex("007FABff"), bytes);
  EXPECT_TRUE(sgax::fromHex("").empty());
}
