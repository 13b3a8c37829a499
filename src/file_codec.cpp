#include <sgax/codecs.hpp>

namespace sgax {

uint8_t FileDefCodec::packFlags(StorageType storage, EncryptionType encryption) noexcept {
  return static_cast<uint8_t>((static_cast<uint8_t>(encryption) << encryptionShift) |
                              static_cast<uint8_t>(storage));
}

void FileDefCodec::unpackFlags(uint8_t flags, StorageType &storage, EncryptionType &encryption) {
  storage = toStorageType(flags & storageMask);
  encryption = toEncryptionType((flags & encryptionMask) >> encryptionShift);
}

FileDef FileDefCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  FileDef entry;
  entry.namePos = record.u32();
  entry.hashPos = record.u32();
  entry.dataPos = record.u64();
  entry.lengthInArchive = record.u32();
  entry.lengthOnDisk = record.u32();
  entry.verification = toVerificationType(record.u8());
  unpackFlags(record.u8(), entry.storage, entry.encryption);
  entry.crc = record.u32();
  return entry;
}

size_t FileDefCodec::encode(ByteWriter &stream, const FileDef &value) const {
  RecordWriter record(layout_);
  record.u32(value.namePos);
  record.u32(value.hashPos);
  record.u64(value.dataPos);
  record.u32(value.lengthInArchive);
  record.u32(value.lengthOnDisk);
  record.u8(static_cast<uint8_t>(value.verification));
  record.u8(packFlags(value.storage, value.encryption));
  record.u32(value.crc);
  return record.commit(stream);
}

} // namespace sgax
