#include <format>
#include <limits>

#include <sgax/metadata.hpp>
#include <sgax/text.hpp>

namespace sgax {

namespace {

const PropertyValue &require(const PropertyMap &properties, std::string_view key) {
  auto it = properties.find(key);
  if (it == properties.end()) {
    throw ParseError(std::format("Missing metadata key '{}'", key));
  }
  return it->second;
}

uint64_t requireInt(const PropertyMap &properties, std::string_view key) {
  const auto *value = std::get_if<uint64_t>(&require(properties, key));
  if (!value) {
    throw ParseError(std::format("Metadata key '{}' must be an integer", key));
  }
  return *value;
}

uint32_t requireU32(const PropertyMap &properties, std::string_view key) {
  uint64_t value = requireInt(properties, key);
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw ParseError(std::format("Metadata key '{}' out of range: {}", key, value));
  }
  return static_cast<uint32_t>(value);
}

const std::string &requireString(const PropertyMap &properties, std::string_view key) {
  const auto *value = std::get_if<std::string>(&require(properties, key));
  if (!value) {
    throw ParseError(std::format("Metadata key '{}' must be a string", key));
  }
  return *value;
}

} // namespace

PropertyMap ArchiveMetadata::toProperties() const {
  PropertyMap properties;
  properties.emplace(keys::sha256, sha256Hex);
  properties.emplace(keys::unkA, uint64_t{unkA});
  properties.emplace(keys::unkB, uint64_t{unkB});
  properties.emplace(keys::blockSize, uint64_t{blockSize});
  return properties;
}

ArchiveMetadata ArchiveMetadata::fromProperties(const PropertyMap &properties) {
  ArchiveMetadata metadata;
  metadata.sha256Hex = requireString(properties, keys::sha256);
  metadata.unkA = requireU32(properties, keys::unkA);
  metadata.unkB = requireU32(properties, keys::unkB);
  metadata.blockSize = requireU32(properties, keys::blockSize);
  return metadata;
}

PropertyMap FileMetadata::toProperties() const {
  PropertyMap properties;
  properties.emplace(keys::storageType, uint64_t{static_cast<uint8_t>(storage)});
  properties.emplace(keys::verificationType, uint64_t{static_cast<uint8_t>(verification)});
  properties.emplace(keys::encryptionType, uint64_t{static_cast<uint8_t>(encryption)});
  properties.emplace(keys::hashPos, uint64_t{hashPos});
  properties.emplace(keys::crc, uint64_t{crc});
  return properties;
}

FileMetadata FileMetadata::fromProperties(const PropertyMap &properties) {
  FileMetadata metadata;
  metadata.storage = toStorageType(requireInt(properties, keys::storageType));
  metadata.verification = toVerificationType(requireInt(properties, keys::verificationType));
  metadata.encryption = toEncryptionType(requireInt(properties, keys::encryptionType));
  metadata.hashPos = requireU32(properties, keys::hashPos);
  metadata.crc = requireU32(properties, keys::crc);
  return metadata;
}

ArchiveMetadata assembleMeta(const MetaBlock &meta, const TocFooter &footer) {
  ArchiveMetadata metadata;
  metadata.sha256Hex = toHex(meta.sha256);
  metadata.unkA = footer.unkA;
  metadata.unkB = footer.unkB;
  metadata.blockSize = footer.blockSize;
  return metadata;
}

std::pair<MetaBlock, TocFooter> disassembleMeta(const ArchiveMetadata &metadata) {
  MetaBlock meta;
  meta.sha256 = fromHex(metadata.sha256Hex);

  TocFooter footer;
  footer.unkA = metadata.unkA;
  footer.unkB = metadata.unkB;
  footer.blockSize = metadata.blockSize;
  return {std::move(meta), footer};
}

FileMetadata buildFileMeta(const FileDef &def) {
  FileMetadata metadata;
  metadata.storage = def.storage;
  metadata.verification = def.verification;
  metadata.encryption = def.encryption;
  metadata.hashPos = def.hashPos;
  metadata.crc = def.crc;
  return metadata;
}

FileDef fileMetaToDef(const FileMetadata &metadata) {
  FileDef def;
  def.storage = metadata.storage;
  def.verification = metadata.verification;
  def.encryption = metadata.encryption;
  def.hashPos = metadata.hashPos;
  def.crc = metadata.crc;
  return def;
}

} // namespace sgax
