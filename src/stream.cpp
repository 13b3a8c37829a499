#include <algorithm>
#include <cstring>
#include <format>
#include <utility>

#include <sgax/stream.hpp>
#include <sgax/types.hpp>

namespace sgax {

void ByteReader::read(std::span<uint8_t> out) {
  auto bytes = take(out.size());
  if (!bytes.empty()) {
    std::memcpy(out.data(), bytes.data(), bytes.size());
  }
}

std::span<const uint8_t> ByteReader::take(size_t count) {
  if (count > remaining()) {
    throw IoError(std::format("Unexpected end of data: wanted {} bytes at offset {}, {} available",
                              count, pos_, remaining()));
  }
  auto bytes = data_.subspan(pos_, count);
  pos_ += count;
  return bytes;
}

void ByteReader::seek(size_t pos) {
  if (pos > data_.size()) {
    throw IoError(std::format("Seek to offset {} beyond end of data (size: {})", pos, data_.size()));
  }
  pos_ = pos;
}

void ByteWriter::write(std::span<const uint8_t> bytes) {
  size_t end = pos_ + bytes.size();
  if (end > buffer_.size()) {
    buffer_.resize(end, 0);
  }
  std::copy(bytes.begin(), bytes.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
  pos_ = end;
}

std::vector<uint8_t> ByteWriter::release() {
  pos_ = 0;
  return std::exchange(buffer_, {});
}

} // namespace sgax
