#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sgax {

// Archive magic, always followed by the version (u16 major, u16 minor)
inline constexpr std::string_view archiveMagic = "_ARCHIVE";

struct Version {
  uint16_t major = 0;
  uint16_t minor = 0;

  static constexpr size_t size = 4;

  auto operator<=>(const Version &) const = default;

  std::string toString() const;
};

// How a file's payload is stored in the data block
enum class StorageType : uint8_t {
  Store = 0,
  BufferCompress = 1,
  StreamCompress = 2,
};

enum class EncryptionType : uint8_t {
  None = 0,
  Aes128 = 1,
};

// Checksum scheme covering a file's payload
enum class VerificationType : uint8_t {
  None = 0,
  Crc = 1,
  CrcBlocks = 2,
  Md5Blocks = 3,
  Sha1Blocks = 4,
};

// Fallible conversions from raw on-disk values; throw DomainError for non-members
StorageType toStorageType(uint64_t value);
EncryptionType toEncryptionType(uint64_t value);
VerificationType toVerificationType(uint64_t value);

const char *toString(StorageType type) noexcept;
const char *toString(EncryptionType type) noexcept;
const char *toString(VerificationType type) noexcept;

// Positions and sizes of the TOC ("header") block and the data block
struct ArchivePtrs {
  uint64_t headerPos = 0;
  uint32_t headerSize = 0;
  uint64_t dataPos = 0;
  uint32_t dataSize = 0;

  bool operator==(const ArchivePtrs &) const = default;
};

// Archive header that follows the magic and version (416 bytes)
struct MetaBlock {
  static constexpr size_t nameSize = 128; // UTF-16LE, NUL padded
  static constexpr size_t hashSize = 256;
  static constexpr uint32_t reserved0 = 0;
  static constexpr uint32_t reserved1 = 1;

  std::string name; // UTF-8
  ArchivePtrs ptrs;
  std::vector<uint8_t> sha256;

  // Placeholder used for write-backs before the final offsets and hash are known
  static MetaBlock makeDefault();

  bool operator==(const MetaBlock &) const = default;
};

// Trailer of the TOC header; unkA/unkB have unknown meaning and are kept verbatim
struct TocFooter {
  uint32_t unkA = 0;
  uint32_t unkB = 0;
  uint32_t blockSize = 0;

  bool operator==(const TocFooter &) const = default;
};

// Offset (relative to ArchivePtrs::headerPos) and count of one TOC table
struct TocSection {
  uint32_t offset = 0;
  uint32_t count = 0;

  bool operator==(const TocSection &) const = default;
};

struct TocHeader {
  TocSection drives;
  TocSection folders;
  TocSection files;
  TocSection names; // count is the byte size of the name block

  bool operator==(const TocHeader &) const = default;
};

struct DriveDef {
  static constexpr size_t textSize = 64;

  std::string alias;
  std::string name;
  uint32_t firstFolder = 0;
  uint32_t lastFolder = 0;
  uint32_t firstFile = 0;
  uint32_t lastFile = 0;
  uint32_t rootFolder = 0;

  bool operator==(const DriveDef &) const = default;
};

struct FolderDef {
  uint32_t namePos = 0;
  uint32_t firstFolder = 0;
  uint32_t lastFolder = 0;
  uint32_t firstFile = 0;
  uint32_t lastFile = 0;

  bool operator==(const FolderDef &) const = default;
};

struct FileDef {
  uint32_t namePos = 0;
  uint32_t hashPos = 0;
  uint64_t dataPos = 0; // relative to ArchivePtrs::dataPos
  uint32_t lengthInArchive = 0;
  uint32_t lengthOnDisk = 0;
  VerificationType verification = VerificationType::None;
  StorageType storage = StorageType::Store;
  EncryptionType encryption = EncryptionType::None;
  uint32_t crc = 0;

  bool operator==(const FileDef &) const = default;
};

// Exception for parsing errors
class ParseError : public std::runtime_error {
public:
  explicit ParseError(const std::string &msg) : std::runtime_error(msg) {}
};

// A magic, version or reserved value differs from the one this format requires
class FormatMismatchError : public ParseError {
public:
  FormatMismatchError(std::string field, std::string observed, std::string expected);

  const std::string &field() const { return field_; }
  const std::string &observed() const { return observed_; }
  const std::string &expected() const { return expected_; }

private:
  std::string field_;
  std::string observed_;
  std::string expected_;
};

// An enum-coded value is not a member of its enumeration
class DomainError : public ParseError {
public:
  DomainError(std::string typeName, uint64_t value);

  const std::string &typeName() const { return typeName_; }
  uint64_t value() const { return value_; }

private:
  std::string typeName_;
  uint64_t value_;
};

// Reading past the end of the input, or a failed file read/write
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string &msg) : std::runtime_error(msg) {}
};

} // namespace sgax
