#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sgax {

// UTF-8 -> UTF-16LE bytes, no terminator; throws ParseError on malformed input
std::vector<uint8_t> utf8ToUtf16le(std::string_view text);

// UTF-16LE bytes -> UTF-8 with trailing NULs stripped; throws ParseError on
// odd length or unpaired surrogates
std::string utf16leToUtf8(std::span<const uint8_t> bytes);

// Fixed-width ASCII field helpers; throw ParseError on bytes >= 0x80
std::vector<uint8_t> asciiToBytes(std::string_view text);
std::string bytesToAscii(std::span<const uint8_t> bytes);

std::string toHex(std::span<const uint8_t> bytes);
std::vector<uint8_t> fromHex(std::string_view hex);

} // namespace sgax
