#include <sgax/codecs.hpp>
#include <sgax/text.hpp>

namespace sgax {

TocHeader TocHeaderCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  TocHeader toc;
  for (TocSection *section : {&toc.drives, &toc.folders, &toc.files, &toc.names}) {
    section->offset = record.u32();
    section->count = record.u32();
  }
  return toc;
}

size_t TocHeaderCodec::encode(ByteWriter &stream, const TocHeader &value) const {
  RecordWriter record(layout_);
  for (const TocSection *section : {&value.drives, &value.folders, &value.files, &value.names}) {
    record.u32(section->offset);
    record.u32(section->count);
  }
  return record.commit(stream);
}

TocFooter TocFooterCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  TocFooter footer;
  footer.unkA = record.u32();
  footer.unkB = record.u32();
  footer.blockSize = record.u32();
  return footer;
}

size_t TocFooterCodec::encode(ByteWriter &stream, const TocFooter &value) const {
  RecordWriter record(layout_);
  record.u32(value.unkA);
  record.u32(value.unkB);
  record.u32(value.blockSize);
  return record.commit(stream);
}

DriveDef DriveDefCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  DriveDef drive;
  drive.alias = bytesToAscii(record.bytes());
  drive.name = bytesToAscii(record.bytes());
  drive.firstFolder = record.u32();
  drive.lastFolder = record.u32();
  drive.firstFile = record.u32();
  drive.lastFile = record.u32();
  drive.rootFolder = record.u32();
  return drive;
}

size_t DriveDefCodec::encode(ByteWriter &stream, const DriveDef &value) const {
  RecordWriter record(layout_);
  record.bytes(asciiToBytes(value.alias));
  record.bytes(asciiToBytes(value.name));
  record.u32(value.firstFolder);
  record.u32(value.lastFolder);
  record.u32(value.firstFile);
  record.u32(value.lastFile);
  record.u32(value.rootFolder);
  return record.commit(stream);
}

FolderDef FolderDefCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  FolderDef folder;
  folder.namePos = record.u32();
  folder.firstFolder = record.u32();
  folder.lastFolder = record.u32();
  folder.firstFile = record.u32();
  folder.lastFile = record.u32();
  return folder;
}

size_t FolderDefCodec::encode(ByteWriter &stream, const FolderDef &value) const {
  RecordWriter record(layout_);
  record.u32(value.namePos);
  record.u32(value.firstFolder);
  record.u32(value.lastFolder);
  record.u32(value.firstFile);
  record.u32(value.lastFile);
  return record.commit(stream);
}

} // namespace sgax
