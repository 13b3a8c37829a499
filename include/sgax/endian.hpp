#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace sgax {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint8_t byteswap(uint8_t value) noexcept { return value; }

inline constexpr uint16_t byteswap(uint16_t value) noexcept {
  return static_cast<uint16_t>((value << 8) | (value >> 8));
}

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return ((value & 0x00000000000000FFull) << 56) | ((value & 0x000000000000FF00ull) << 40) |
         ((value & 0x0000000000FF0000ull) << 24) | ((value & 0x00000000FF000000ull) << 8) |
         ((value & 0x000000FF00000000ull) >> 8) | ((value & 0x0000FF0000000000ull) >> 24) |
         ((value & 0x00FF000000000000ull) >> 40) | ((value & 0xFF00000000000000ull) >> 56);
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert little-endian to host byte order
template <typename T> inline constexpr T letoh(T value) noexcept {
  static_assert(std::is_unsigned_v<T>);
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
template <typename T> inline constexpr T htole(T value) noexcept {
  static_assert(std::is_unsigned_v<T>);
  if constexpr (!is_little_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Read an unaligned little-endian integer from raw memory
template <typename T> inline T loadLE(const uint8_t *src) noexcept {
  T value;
  std::memcpy(&value, src, sizeof(T));
  return letoh(value);
}

// Write an unaligned little-endian integer to raw memory
template <typename T> inline void storeLE(uint8_t *dst, T value) noexcept {
  T stored = htole(value);
  std::memcpy(dst, &stored, sizeof(T));
}

} // namespace sgax
