#include <vector>

#include <sgax/archive_codec.hpp>
#include <sgax/codecs.hpp>

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace sgax_test;

class FileDefCodecTest : public ::testing::Test {
protected:
  const sgax::FileDefCodec &codec() const { return v10_.parts().file; }

  sgax::FileDef decode(const std::vector<uint8_t> &bytes) const {
    sgax::ByteReader stream(bytes);
    return codec().decode(stream);
  }

  std::vector<uint8_t> encode(const sgax::FileDef &def) const {
    sgax::ByteWriter stream;
    EXPECT_EQ(codec().encode(stream, def), 30u);
    return stream.release();
  }

  // 30-byte entry with the given verification and packed flag bytes
  static std::vector<uint8_t> entryBytes(uint8_t verification, uint8_t flags) {
    std::vector<uint8_t> out;
    putU32(out, 0x10);
    putU32(out, 0x20);
    putU64(out, 0x1000);
    putU32(out, 100);
    putU32(out, 50);
    putU8(out, verification);
    putU8(out, flags);
    putU32(out, 0xDEADBEEF);
    return out;
  }

  sgax::ArchiveCodec v10_ = sgax::ArchiveCodec::makeV10();
};

TEST_F(FileDefCodecTest, LayoutIs30Bytes) {
  EXPECT_EQ(codec().layout().size(), 30u);
}

TEST_F(FileDefCodecTest, DecodesPackedEntry) {
  auto bytes = entryBytes(1, 0x12);
  ASSERT_EQ(bytes.size(), 30u);

  auto def = decode(bytes);
  EXPECT_EQ(def.namePos, 0x10u);
  EXPECT_EQ(def.hashPos, 0x20u);
  EXPECT_EQ(def.dataPos, 0x1000u);
  EXPECT_EQ(def.lengthInArchive, 100u);
  EXPECT_EQ(def.lengthOnDisk, 50u);
  EXPECT_EQ(def.verification, sgax::VerificationType::Crc);
  EXPECT_EQ(def.storage, sgax::StorageType::StreamCompress);
  EXPECT_EQ(def.encryption, sgax::EncryptionType::Aes128);
  EXPECT_EQ(def.crc, 0xDEADBEEFu);

  EXPECT_EQ(encode(def), bytes);
}

TEST_F(FileDefCodecTest, DecodeAdvancesStreamByOneEntry) {
  auto bytes = entryBytes(0, 0x00);
  auto second = entryBytes(4, 0x11);
  bytes.insert(bytes.end(), second.begin(), second.end());

  sgax::ByteReader stream(bytes);
  codec().decode(stream);
  EXPECT_EQ(stream.tell(), 30u);
  auto def = codec().decode(stream);
  EXPECT_EQ(def.verification, sgax::VerificationType::Sha1Blocks);
  EXPECT_EQ(def.storage, sgax::StorageType::BufferCompress);
  EXPECT_EQ(def.encryption, sgax::EncryptionType::Aes128);
  EXPECT_EQ(stream.remaining(), 0u);
}

TEST_F(FileDefCodecTest, AllStorageAndEncryptionPairsSurvivePacking) {
  const sgax::StorageType storages[] = {sgax::StorageType::Store,
                                        sgax::StorageType::BufferCompress,
                                        sgax::StorageType::StreamCompress};
  const sgax::EncryptionType encryptions[] = {sgax::EncryptionType::None,
                                              sgax::EncryptionType::Aes128};

  for (auto storage : storages) {
    for (auto encryption : encryptions) {
      sgax::FileDef def;
      def.namePos = 1;
      def.dataPos = 0xFFFFFFFF00000001ull;
      def.storage = storage;
      def.encryption = encryption;

      auto bytes = encode(def);
      EXPECT_EQ(bytes[25], (static_cast<uint8_t>(encryption) << 4) | static_cast<uint8_t>(storage));
      EXPECT_EQ(decode(bytes), def);
    }
  }
}

TEST_F(FileDefCodecTest, EveryFlagByteEitherDecodesOrRaisesDomainError) {
  for (int flags = 0; flags < 256; ++flags) {
    auto bytes = entryBytes(0, static_cast<uint8_t>(flags));
    bool storageValid = (flags & 0x0F) < 3;
    bool encryptionValid = (flags >> 4) < 2;

    if (storageValid && encryptionValid) {
      auto def = decode(bytes);
      EXPECT_EQ(static_cast<int>(def.storage), flags & 0x0F);
      EXPECT_EQ(static_cast<int>(def.encryption), flags >> 4);
      EXPECT_EQ(encode(def), bytes);
    } else {
      EXPECT_THROW(decode(bytes), sgax::DomainError) << "flags=" << flags;
    }
  }
}

TEST_F(FileDefCodecTest, DomainErrorNamesTypeAndValue) {
  try {
    decode(entryBytes(0, 0x07));
    FAIL() << "Expected DomainError";
  } catch (const sgax::DomainError &e) {
    EXPECT_EQ(e.typeName(), "StorageType");
    EXPECT_EQ(e.value(), 7u);
  }

  try {
    decode(entryBytes(0, 0x30));
    FAIL() << "Expected DomainError";
  } catch (const sgax::DomainError &e) {
    EXPECT_EQ(e.typeName(), "EncryptionType");
    EXPECT_EQ(e.value(), 3u);
  }
}

TEST_F(FileDefCodecTest, UnknownVerificationTypeIsRejected) {
  for (uint8_t verification = 0; verification < 5; ++verification) {
    EXPECT_NO_THROW(decode(entryBytes(verification, 0)));
  }
  EXPECT_THROW(decode(entryBytes(5, 0)), sgax::DomainError);
  EXPECT_THROW(decode(entryBytes(0xFF, 0)), sgax::DomainError);
}

TEST_F(FileDefCodecTest, TruncatedEntryRaisesIoError) {
  auto bytes = entryBytes(1, 0x12);
  bytes.pop_back();
  EXPECT_THROW(decode(bytes), sgax::IoError);
}

TEST_F(FileDefCodecTest, PackFlagsHelpers) {
  EXPECT_EQ(sgax::FileDefCodec::packFlags(sgax::StorageType::BufferCompress,
                                          sgax::EncryptionType::None),
            0x01);

  sgax::StorageType storage;
  sgax::EncryptionType encryption;
  sgax::FileDefCodec::unpackFlags(0x10, storage, encryption);
  EXPECT_EQ(storage, sgax::StorageType::Store);
  EXPECT_EQ(encryption, sgax::EncryptionType::Aes128);
}
