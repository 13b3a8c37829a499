#include <format>
#include <stdexcept>

#include <sgax/codecs.hpp>
#include <sgax/text.hpp>

namespace sgax {

MetaBlock MetaBlockCodec::decode(ByteReader &stream) const {
  RecordReader record(layout_, stream);

  MetaBlock meta;
  meta.name = utf16leToUtf8(record.bytes());
  meta.ptrs.headerPos = record.u64();
  meta.ptrs.headerSize = record.u32();
  meta.ptrs.dataPos = record.u64();
  meta.ptrs.dataSize = record.u32();
  uint32_t rsv0 = record.u32();
  uint32_t rsv1 = record.u32();
  auto hash = record.bytes();
  meta.sha256.assign(hash.begin(), hash.end());

  if (rsv0 != MetaBlock::reserved0 || rsv1 != MetaBlock::reserved1) {
    throw FormatMismatchError("Reserved Flags", std::format("({}, {})", rsv0, rsv1),
                              std::format("({}, {})", MetaBlock::reserved0, MetaBlock::reserved1));
  }

  return meta;
}

size_t MetaBlockCodec::encode(ByteWriter &stream, const MetaBlock &value) const {
  auto encodedName = utf8ToUtf16le(value.name);
  if (encodedName.size() > MetaBlock::nameSize) {
    throw std::length_error(std::format("Archive name '{}' needs {} bytes, field holds {}",
                                        value.name, encodedName.size(), MetaBlock::nameSize));
  }

  RecordWriter record(layout_);
  record.bytes(encodedName);
  record.u64(value.ptrs.headerPos);
  record.u32(value.ptrs.headerSize);
  record.u64(value.ptrs.dataPos);
  record.u32(value.ptrs.dataSize);
  record.u32(MetaBlock::reserved0);
  record.u32(MetaBlock::reserved1);
  record.bytes(value.sha256);
  return record.commit(stream);
}

} // namespace sgax
