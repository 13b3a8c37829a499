#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "codecs.hpp"
#include "metadata.hpp"
#include "stream.hpp"
#include "types.hpp"

namespace sgax {

// Everything needed to materialize or re-serialize one archive.
// Payload bytes stay opaque: compression and encryption are not interpreted here.
struct ArchiveRecords {
  Version version;
  MetaBlock meta;
  TocHeader toc;
  TocFooter footer;
  std::vector<DriveDef> drives;
  std::vector<FolderDef> folders;
  std::vector<FileDef> files;
  std::vector<uint8_t> names; // raw name block, entries are NUL-terminated
  std::vector<uint8_t> data;  // raw data block

  bool operator==(const ArchiveRecords &) const = default;
};

// Read "_ARCHIVE" and the version that follows it
// Throws FormatMismatchError on a wrong magic, IoError if the input is too short
Version readVersion(ByteReader &stream);
size_t writeVersion(ByteWriter &stream, Version version);

// NUL-terminated entry of a name block at the given offset
// Throws ParseError if the offset is out of range or the entry is unterminated
std::string nameAt(std::span<const uint8_t> names, uint32_t offset);

// Bundles the record codecs and metadata bridge for one archive version
class ArchiveCodec {
public:
  struct Parts {
    Version version;
    MetaBlockCodec meta;
    TocHeaderCodec tocHeader;
    TocFooterCodec tocFooter;
    FileDefCodec file;
    DriveDefCodec drive;
    FolderDefCodec folder;
  };

  explicit ArchiveCodec(Parts parts) : parts_(std::move(parts)) {}

  // Codec for SGA 10.0
  static ArchiveCodec makeV10();

  Version version() const { return parts_.version; }
  const Parts &parts() const { return parts_; }

  // Decode a whole archive, starting with its magic and version
  ArchiveRecords decode(ByteReader &stream) const;

  // Encode a whole archive; block pointers and TOC offsets are recomputed, so
  // records.meta.ptrs and records.toc offsets are ignored
  size_t encode(ByteWriter &stream, const ArchiveRecords &records) const;

  ArchiveMetadata assembleMeta(const MetaBlock &meta, const TocFooter &footer) const;
  std::pair<MetaBlock, TocFooter> disassembleMeta(const ArchiveMetadata &metadata) const;
  FileMetadata buildFileMeta(const FileDef &def) const;
  FileDef fileMetaToDef(const FileMetadata &metadata) const;

  MetaBlock makeEmptyMeta() const { return MetaBlock::makeDefault(); }

  // Runs after the final meta block is written; v10 has nothing to do here
  void finalizeMeta(ByteWriter &stream, MetaBlock &meta) const;

private:
  Parts parts_;
};

} // namespace sgax
