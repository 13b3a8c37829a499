#pragma once

#include <cstdint>
#include <utility>

#include "layout.hpp"
#include "stream.hpp"
#include "types.hpp"

namespace sgax {

// Each codec converts one fixed-width record between its byte layout and its
// typed value. Codecs are immutable after construction and may be shared
// between threads; the stream cursor may not.

class MetaBlockCodec {
public:
  explicit MetaBlockCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  // Throws FormatMismatchError if the reserved fields are not (0, 1)
  MetaBlock decode(ByteReader &stream) const;

  // Always writes the reserved constants; throws std::length_error if the
  // encoded name or the hash does not fit its field
  size_t encode(ByteWriter &stream, const MetaBlock &value) const;

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

class TocHeaderCodec {
public:
  explicit TocHeaderCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  TocHeader decode(ByteReader &stream) const;
  size_t encode(ByteWriter &stream, const TocHeader &value) const;

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

class TocFooterCodec {
public:
  explicit TocFooterCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  TocFooter decode(ByteReader &stream) const;
  size_t encode(ByteWriter &stream, const TocFooter &value) const;

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

class DriveDefCodec {
public:
  explicit DriveDefCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  DriveDef decode(ByteReader &stream) const;
  size_t encode(ByteWriter &stream, const DriveDef &value) const;

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

class FolderDefCodec {
public:
  explicit FolderDefCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  FolderDef decode(ByteReader &stream) const;
  size_t encode(ByteWriter &stream, const FolderDef &value) const;

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

// Storage type lives in the low nibble of one byte, encryption in the high one
class FileDefCodec {
public:
  static constexpr uint8_t storageMask = 0x0F;
  static constexpr uint8_t encryptionMask = 0xF0;
  static constexpr int encryptionShift = 4;

  explicit FileDefCodec(RecordLayout layout) : layout_(std::move(layout)) {}

  // Throws DomainError for unknown storage, encryption or verification values
  FileDef decode(ByteReader &stream) const;
  size_t encode(ByteWriter &stream, const FileDef &value) const;

  static uint8_t packFlags(StorageType storage, EncryptionType encryption) noexcept;
  static void unpackFlags(uint8_t flags, StorageType &storage, EncryptionType &encryption);

  const RecordLayout &layout() const { return layout_; }

private:
  RecordLayout layout_;
};

} // namespace sgax
