#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include "stream.hpp"

namespace sgax {

enum class FieldKind : uint8_t { UInt8, UInt16, UInt32, UInt64, Bytes };

struct FieldSpec {
  FieldKind kind;
  size_t width;
};

inline constexpr FieldSpec u8Field{FieldKind::UInt8, 1};
inline constexpr FieldSpec u16Field{FieldKind::UInt16, 2};
inline constexpr FieldSpec u32Field{FieldKind::UInt32, 4};
inline constexpr FieldSpec u64Field{FieldKind::UInt64, 8};
inline constexpr FieldSpec bytesField(size_t width) { return {FieldKind::Bytes, width}; }

// Fixed-width little-endian record description, e.g. {u32Field, u32Field, u64Field}
// Immutable once constructed; codecs hold one each
class RecordLayout {
public:
  RecordLayout(std::initializer_list<FieldSpec> fields);

  // Same field repeated count times
  static RecordLayout repeated(FieldSpec field, size_t count);

  size_t size() const { return size_; }
  size_t fieldCount() const { return fields_.size(); }
  const FieldSpec &field(size_t index) const { return fields_.at(index); }

  // Human-readable description, e.g. "<I I Q 128s>"
  std::string describe() const;

private:
  RecordLayout() = default;

  std::vector<FieldSpec> fields_;
  size_t size_ = 0;
};

// Reads one whole record up front, then hands out its fields in layout order
class RecordReader {
public:
  RecordReader(const RecordLayout &layout, ByteReader &stream);

  uint8_t u8();
  uint16_t u16();
  uint32_t u32();
  uint64_t u64();
  std::span<const uint8_t> bytes();

private:
  const uint8_t *next(FieldKind kind);

  const RecordLayout &layout_;
  std::span<const uint8_t> record_;
  size_t field_ = 0;
  size_t offset_ = 0;
};

// Collects fields in layout order, then writes the record in one go
class RecordWriter {
public:
  explicit RecordWriter(const RecordLayout &layout);

  void u8(uint8_t value);
  void u16(uint16_t value);
  void u32(uint32_t value);
  void u64(uint64_t value);

  // Zero-padded to the field width; throws std::length_error if longer
  void bytes(std::span<const uint8_t> value);

  // Returns the number of bytes written (always layout.size())
  size_t commit(ByteWriter &stream);

private:
  uint8_t *next(FieldKind kind);

  const RecordLayout &layout_;
  std::vector<uint8_t> record_;
  size_t field_ = 0;
  size_t offset_ = 0;
};

} // namespace sgax
