#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace sgax {

// Seekable read cursor over an in-memory archive image
// Reads past the end throw IoError; the underlying bytes must outlive the reader
class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

  // Copy exactly out.size() bytes and advance
  void read(std::span<uint8_t> out);

  // Borrow the next count bytes without copying and advance
  std::span<const uint8_t> take(size_t count);

  void seek(size_t pos);
  size_t tell() const { return pos_; }
  size_t size() const { return data_.size(); }
  size_t remaining() const { return data_.size() - pos_; }

private:
  std::span<const uint8_t> data_;
  size_t pos_ = 0;
};

// Seekable write cursor; writing beyond the current end grows the buffer
// Seeking past the end zero-fills the gap on the next write
class ByteWriter {
public:
  ByteWriter() = default;

  void write(std::span<const uint8_t> bytes);

  void seek(size_t pos) { pos_ = pos; }
  size_t tell() const { return pos_; }
  size_t size() const { return buffer_.size(); }

  const std::vector<uint8_t> &buffer() const { return buffer_; }
  std::vector<uint8_t> release();

private:
  std::vector<uint8_t> buffer_;
  size_t pos_ = 0;
};

} // namespace sgax
