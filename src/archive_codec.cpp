#include <algorithm>
#include <format>
#include <limits>
#include <stdexcept>

#include <sgax/archive_codec.hpp>
#include <sgax/endian.hpp>

namespace sgax {

namespace {

std::string printable(std::span<const uint8_t> bytes) {
  std::string out;
  for (uint8_t byte : bytes) {
    out += (byte >= 0x20 && byte < 0x7F) ? static_cast<char>(byte) : '.';
  }
  return out;
}

template <typename T> uint32_t checkedU32(T value, const char *what) {
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error(std::format("{} too large for a 32-bit field: {}", what, value));
  }
  return static_cast<uint32_t>(value);
}

template <typename Codec>
auto readTable(const Codec &codec, ByteReader &stream, size_t pos, const TocSection &section,
               const char *what) {
  std::vector<decltype(codec.decode(stream))> table;
  stream.seek(pos);
  // Sanity check against corrupt counts before reserving
  if (static_cast<uint64_t>(section.count) * codec.layout().size() > stream.remaining()) {
    throw ParseError(std::format("{} table ({} entries at offset {}) extends beyond end of data",
                                 what, section.count, pos));
  }
  table.reserve(section.count);
  for (uint32_t i = 0; i < section.count; ++i) {
    table.push_back(codec.decode(stream));
  }
  return table;
}

} // namespace

Version readVersion(ByteReader &stream) {
  auto magic = stream.take(archiveMagic.size());
  if (!std::equal(magic.begin(), magic.end(), archiveMagic.begin(), archiveMagic.end(),
                  [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); })) {
    throw FormatMismatchError("Magic Word", std::format("'{}'", printable(magic)),
                              std::format("'{}'", archiveMagic));
  }

  auto raw = stream.take(Version::size);
  Version version;
  version.major = loadLE<uint16_t>(raw.data());
  version.minor = loadLE<uint16_t>(raw.data() + 2);
  return version;
}

size_t writeVersion(ByteWriter &stream, Version version) {
  stream.write({reinterpret_cast<const uint8_t *>(archiveMagic.data()), archiveMagic.size()});
  uint8_t raw[Version::size];
  storeLE(raw, version.major);
  storeLE(raw + 2, version.minor);
  stream.write(raw);
  return archiveMagic.size() + Version::size;
}

std::string nameAt(std::span<const uint8_t> names, uint32_t offset) {
  if (offset >= names.size()) {
    throw ParseError(
        std::format("Name offset {} outside name block (size: {})", offset, names.size()));
  }
  auto begin = names.begin() + offset;
  auto end = std::find(begin, names.end(), uint8_t{0});
  if (end == names.end()) {
    throw ParseError(std::format("Name at offset {} has no terminator", offset));
  }
  return std::string(begin, end);
}

ArchiveCodec ArchiveCodec::makeV10() {
  return ArchiveCodec(Parts{
      .version = {10, 0},
      .meta = MetaBlockCodec({bytesField(MetaBlock::nameSize), u64Field, u32Field, u64Field,
                              u32Field, u32Field, u32Field, bytesField(MetaBlock::hashSize)}),
      .tocHeader = TocHeaderCodec(RecordLayout::repeated(u32Field, 8)),
      .tocFooter = TocFooterCodec(RecordLayout::repeated(u32Field, 3)),
      .file = FileDefCodec(
          {u32Field, u32Field, u64Field, u32Field, u32Field, u8Field, u8Field, u32Field}),
      .drive = DriveDefCodec({bytesField(DriveDef::textSize), bytesField(DriveDef::textSize),
                              u32Field, u32Field, u32Field, u32Field, u32Field}),
      .folder = FolderDefCodec(RecordLayout::repeated(u32Field, 5)),
  });
}

ArchiveRecords ArchiveCodec::decode(ByteReader &stream) const {
  ArchiveRecords records;
  records.version = readVersion(stream);
  if (records.version != parts_.version) {
    throw FormatMismatchError("Version", records.version.toString(), parts_.version.toString());
  }

  records.meta = parts_.meta.decode(stream);
  const auto &ptrs = records.meta.ptrs;

  stream.seek(ptrs.headerPos);
  records.toc = parts_.tocHeader.decode(stream);
  records.footer = parts_.tocFooter.decode(stream);

  const auto &toc = records.toc;
  records.drives = readTable(parts_.drive, stream, ptrs.headerPos + toc.drives.offset,
                             toc.drives, "Drive");
  records.folders = readTable(parts_.folder, stream, ptrs.headerPos + toc.folders.offset,
                              toc.folders, "Folder");
  records.files =
      readTable(parts_.file, stream, ptrs.headerPos + toc.files.offset, toc.files, "File");

  stream.seek(ptrs.headerPos + toc.names.offset);
  auto names = stream.take(toc.names.count);
  records.names.assign(names.begin(), names.end());

  stream.seek(ptrs.dataPos);
  auto data = stream.take(ptrs.dataSize);
  records.data.assign(data.begin(), data.end());

  return records;
}

size_t ArchiveCodec::encode(ByteWriter &stream, const ArchiveRecords &records) const {
  size_t start = stream.tell();
  writeVersion(stream, parts_.version);

  // Placeholder until the block pointers are known
  size_t metaPos = stream.tell();
  parts_.meta.encode(stream, makeEmptyMeta());

  MetaBlock meta = records.meta;
  meta.ptrs.dataPos = stream.tell();
  meta.ptrs.dataSize = checkedU32(records.data.size(), "Data block");
  stream.write(records.data);

  meta.ptrs.headerPos = stream.tell();

  TocHeader toc;
  uint64_t offset = parts_.tocHeader.layout().size() + parts_.tocFooter.layout().size();
  toc.drives = {checkedU32(offset, "Drive table offset"),
                checkedU32(records.drives.size(), "Drive count")};
  offset += records.drives.size() * parts_.drive.layout().size();
  toc.folders = {checkedU32(offset, "Folder table offset"),
                 checkedU32(records.folders.size(), "Folder count")};
  offset += records.folders.size() * parts_.folder.layout().size();
  toc.files = {checkedU32(offset, "File table offset"),
               checkedU32(records.files.size(), "File count")};
  offset += records.files.size() * parts_.file.layout().size();
  toc.names = {checkedU32(offset, "Name block offset"),
               checkedU32(records.names.size(), "Name block")};

  parts_.tocHeader.encode(stream, toc);
  parts_.tocFooter.encode(stream, records.footer);
  for (const auto &drive : records.drives) {
    parts_.drive.encode(stream, drive);
  }
  for (const auto &folder : records.folders) {
    parts_.folder.encode(stream, folder);
  }
  for (const auto &file : records.files) {
    parts_.file.encode(stream, file);
  }
  stream.write(records.names);

  size_t end = stream.tell();
  meta.ptrs.headerSize = checkedU32(end - meta.ptrs.headerPos, "TOC block");

  stream.seek(metaPos);
  parts_.meta.encode(stream, meta);
  finalizeMeta(stream, meta);
  stream.seek(end);

  return end - start;
}

ArchiveMetadata ArchiveCodec::assembleMeta(const MetaBlock &meta, const TocFooter &footer) const {
  return sgax::assembleMeta(meta, footer);
}

std::pair<MetaBlock, TocFooter>
ArchiveCodec::disassembleMeta(const ArchiveMetadata &metadata) const {
  return sgax::disassembleMeta(metadata);
}

FileMetadata ArchiveCodec::buildFileMeta(const FileDef &def) const {
  return sgax::buildFileMeta(def);
}

FileDef ArchiveCodec::fileMetaToDef(const FileMetadata &metadata) const {
  return sgax::fileMetaToDef(metadata);
}

void ArchiveCodec::finalizeMeta(ByteWriter &, MetaBlock &) const {}

} // namespace sgax
