#include <format>
#include <utility>

#include <sgax/types.hpp>

namespace sgax {

std::string Version::toString() const {
  return std::format("{}.{}", major, minor);
}

StorageType toStorageType(uint64_t value) {
  switch (value) {
  case 0:
    return StorageType::Store;
  case 1:
    return StorageType::BufferCompress;
  case 2:
    return StorageType::StreamCompress;
  default:
    throw DomainError("StorageType", value);
  }
}

EncryptionType toEncryptionType(uint64_t value) {
  switch (value) {
  case 0:
    return EncryptionType::None;
  case 1:
    return EncryptionType::Aes128;
  default:
    throw DomainError("EncryptionType", value);
  }
}

VerificationType toVerificationType(uint64_t value) {
  switch (value) {
  case 0:
    return VerificationType::None;
  case 1:
    return VerificationType::Crc;
  case 2:
    return VerificationType::CrcBlocks;
  case 3:
    return VerificationType::Md5Blocks;
  case 4:
    return VerificationType::Sha1Blocks;
  default:
    throw DomainError("VerificationType", value);
  }
}

const char *toString(StorageType type) noexcept {
  switch (type) {
  case StorageType::Store:
    return "store";
  case StorageType::BufferCompress:
    return "buffer-compress";
  case StorageType::StreamCompress:
    return "stream-compress";
  }
  return "?";
}

const char *toString(EncryptionType type) noexcept {
  switch (type) {
  case EncryptionType::None:
    return "none";
  case EncryptionType::Aes128:
    return "aes-128";
  }
  return "?";
}

const char *toString(VerificationType type) noexcept {
  switch (type) {
  case VerificationType::None:
    return "none";
  case VerificationType::Crc:
    return "crc";
  case VerificationType::CrcBlocks:
    return "crc-blocks";
  case VerificationType::Md5Blocks:
    return "md5-blocks";
  case VerificationType::Sha1Blocks:
    return "sha1-blocks";
  }
  return "?";
}

MetaBlock MetaBlock::makeDefault() {
  static constexpr std::string_view pattern = "default hash.   ";
  static_assert(hashSize % pattern.size() == 0);

  MetaBlock meta;
  meta.name = "Default Meta Block";
  meta.sha256.reserve(hashSize);
  while (meta.sha256.size() < hashSize) {
    meta.sha256.insert(meta.sha256.end(), pattern.begin(), pattern.end());
  }
  return meta;
}

FormatMismatchError::FormatMismatchError(std::string field, std::string observed,
                                         std::string expected)
    : ParseError(std::format("{} mismatch: got {}, expected {}", field, observed, expected)),
      field_(std::move(field)), observed_(std::move(observed)), expected_(std::move(expected)) {}

DomainError::DomainError(std::string typeName, uint64_t value)
    : ParseError(std::format("{} has no member with value {}", typeName, value)),
      typeName_(std::move(typeName)), value_(value) {}

} // namespace sgax
