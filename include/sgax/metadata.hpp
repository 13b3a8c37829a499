#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "types.hpp"

namespace sgax {

// Generic key/value view handed to code that does not know the v10 records
using PropertyValue = std::variant<std::string, uint64_t>;
using PropertyMap = std::map<std::string, PropertyValue, std::less<>>;

namespace keys {
inline constexpr std::string_view sha256 = "sha_256";
inline constexpr std::string_view unkA = "unk_a";
inline constexpr std::string_view unkB = "unk_b";
inline constexpr std::string_view blockSize = "block_size";

inline constexpr std::string_view storageType = "storage_type";
inline constexpr std::string_view verificationType = "verification_type";
inline constexpr std::string_view encryptionType = "encryption_type";
inline constexpr std::string_view hashPos = "hash_pos";
inline constexpr std::string_view crc = "crc";
} // namespace keys

// Archive-level metadata that the archive name and block pointers are not part of
struct ArchiveMetadata {
  static constexpr int schemaVersion = 1;

  std::string sha256Hex;
  uint32_t unkA = 0;
  uint32_t unkB = 0;
  uint32_t blockSize = 0;

  PropertyMap toProperties() const;

  // Throws ParseError on missing keys, wrong value types or out-of-range integers
  static ArchiveMetadata fromProperties(const PropertyMap &properties);

  bool operator==(const ArchiveMetadata &) const = default;
};

// Per-file metadata; positions and lengths depend on final layout and are not kept
struct FileMetadata {
  static constexpr int schemaVersion = 1;

  StorageType storage = StorageType::Store;
  VerificationType verification = VerificationType::None;
  EncryptionType encryption = EncryptionType::None;
  uint32_t hashPos = 0;
  uint32_t crc = 0;

  PropertyMap toProperties() const;

  // As ArchiveMetadata::fromProperties; unknown enum values throw DomainError
  static FileMetadata fromProperties(const PropertyMap &properties);

  bool operator==(const FileMetadata &) const = default;
};

ArchiveMetadata assembleMeta(const MetaBlock &meta, const TocFooter &footer);

// The returned MetaBlock has an empty name and zeroed ptrs; the writer fills them in
std::pair<MetaBlock, TocFooter> disassembleMeta(const ArchiveMetadata &metadata);

FileMetadata buildFileMeta(const FileDef &def);

// Positions and lengths of the returned FileDef are zero
FileDef fileMetaToDef(const FileMetadata &metadata);

} // namespace sgax
