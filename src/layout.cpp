#include <algorithm>
#include <format>
#include <stdexcept>

#include <sgax/endian.hpp>
#include <sgax/layout.hpp>

namespace sgax {

namespace {

const char *kindCode(FieldKind kind) {
  switch (kind) {
  case FieldKind::UInt8:
    return "B";
  case FieldKind::UInt16:
    return "H";
  case FieldKind::UInt32:
    return "I";
  case FieldKind::UInt64:
    return "Q";
  case FieldKind::Bytes:
    return "s";
  }
  return "?";
}

} // namespace

RecordLayout::RecordLayout(std::initializer_list<FieldSpec> fields) : fields_(fields) {
  for (const auto &field : fields_) {
    size_ += field.width;
  }
}

RecordLayout RecordLayout::repeated(FieldSpec field, size_t count) {
  RecordLayout layout;
  layout.fields_.assign(count, field);
  layout.size_ = field.width * count;
  return layout;
}

std::string RecordLayout::describe() const {
  std::string result = "<";
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (i > 0) {
      result += ' ';
    }
    if (fields_[i].kind == FieldKind::Bytes) {
      result += std::format("{}", fields_[i].width);
    }
    result += kindCode(fields_[i].kind);
  }
  result += '>';
  return result;
}

RecordReader::RecordReader(const RecordLayout &layout, ByteReader &stream)
    : layout_(layout), record_(stream.take(layout.size())) {}

const uint8_t *RecordReader::next(FieldKind kind) {
  if (field_ >= layout_.fieldCount()) {
    throw std::logic_error(
        std::format("Read past last field of layout {}", layout_.describe()));
  }
  const auto &spec = layout_.field(field_);
  if (spec.kind != kind) {
    throw std::logic_error(std::format("Field {} of layout {} read as '{}'", field_,
                                       layout_.describe(), kindCode(kind)));
  }
  const uint8_t *ptr = record_.data() + offset_;
  offset_ += spec.width;
  ++field_;
  return ptr;
}

uint8_t RecordReader::u8() {
  return *next(FieldKind::UInt8);
}

uint16_t RecordReader::u16() {
  return loadLE<uint16_t>(next(FieldKind::UInt16));
}

uint32_t RecordReader::u32() {
  return loadLE<uint32_t>(next(FieldKind::UInt32));
}

uint64_t RecordReader::u64() {
  return loadLE<uint64_t>(next(FieldKind::UInt64));
}

std::span<const uint8_t> RecordReader::bytes() {
  const uint8_t *ptr = next(FieldKind::Bytes);
  return {ptr, layout_.field(field_ - 1).width};
}

RecordWriter::RecordWriter(const RecordLayout &layout)
    : layout_(layout), record_(layout.size(), 0) {}

uint8_t *RecordWriter::next(FieldKind kind) {
  if (field_ >= layout_.fieldCount()) {
    throw std::logic_error(
        std::format("Write past last field of layout {}", layout_.describe()));
  }
  const auto &spec = layout_.field(field_);
  if (spec.kind != kind) {
    throw std::logic_error(std::format("Field {} of layout {} written as '{}'", field_,
                                       layout_.describe(), kindCode(kind)));
  }
  uint8_t *ptr = record_.data() + offset_;
  offset_ += spec.width;
  ++field_;
  return ptr;
}

void RecordWriter::u8(uint8_t value) {
  *next(FieldKind::UInt8) = value;
}

void RecordWriter::u16(uint16_t value) {
  storeLE(next(FieldKind::UInt16), value);
}

void RecordWriter::u32(uint32_t value) {
  storeLE(next(FieldKind::UInt32), value);
}

void RecordWriter::u64(uint64_t value) {
  storeLE(next(FieldKind::UInt64), value);
}

void RecordWriter::bytes(std::span<const uint8_t> value) {
  if (field_ < layout_.fieldCount() && value.size() > layout_.field(field_).width) {
    throw std::length_error(std::format("Value of {} bytes does not fit field {} ({} bytes)",
                                        value.size(), field_, layout_.field(field_).width));
  }
  uint8_t *ptr = next(FieldKind::Bytes);
  std::copy(value.begin(), value.end(), ptr);
}

size_t RecordWriter::commit(ByteWriter &stream) {
  if (field_ != layout_.fieldCount()) {
    throw std::logic_error(std::format("Record for layout {} committed with {} of {} fields",
                                       layout_.describe(), field_, layout_.fieldCount()));
  }
  stream.write(record_);
  return record_.size();
}

} // namespace sgax
