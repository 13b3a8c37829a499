#include <format>

#include <sgax/endian.hpp>
#include <sgax/text.hpp>
#include <sgax/types.hpp>

namespace sgax {

namespace {

constexpr char32_t codePointMax = 0x10FFFF;

// high surrogates: 0xd800 - 0xdbff
// low surrogates:  0xdc00 - 0xdfff
constexpr char16_t leadSurrogateMin = 0xD800;
constexpr char16_t leadSurrogateMax = 0xDBFF;
constexpr char16_t trailSurrogateMin = 0xDC00;
constexpr char16_t trailSurrogateMax = 0xDFFF;

constexpr bool isLeadSurrogate(char32_t cp) {
  return leadSurrogateMin <= cp && cp <= leadSurrogateMax;
}

constexpr bool isTrailSurrogate(char32_t cp) {
  return trailSurrogateMin <= cp && cp <= trailSurrogateMax;
}

// Number of continuation bytes following a lead byte, or -1 if not a lead byte
int continuationCount(uint8_t lead) {
  if (lead < 0x80) {
    return 0;
  }
  if ((lead & 0xE0) == 0xC0) {
    return 1;
  }
  if ((lead & 0xF0) == 0xE0) {
    return 2;
  }
  if ((lead & 0xF8) == 0xF0) {
    return 3;
  }
  return -1;
}

void appendUnit(std::vector<uint8_t> &out, char16_t unit) {
  uint8_t bytes[2];
  storeLE(bytes, static_cast<uint16_t>(unit));
  out.push_back(bytes[0]);
  out.push_back(bytes[1]);
}

void appendUtf8(std::string &out, char32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

std::vector<uint8_t> utf8ToUtf16le(std::string_view text) {
  std::vector<uint8_t> out;
  out.reserve(text.size() * 2);

  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<uint8_t>(text[i]);
    int extra = continuationCount(lead);
    if (extra < 0 || i + extra >= text.size()) {
      throw ParseError(std::format("Invalid UTF-8 sequence at byte {}", i));
    }

    static constexpr uint8_t leadMask[] = {0x7F, 0x1F, 0x0F, 0x07};
    char32_t cp = lead & leadMask[extra];
    for (int k = 1; k <= extra; ++k) {
      auto trail = static_cast<uint8_t>(text[i + k]);
      if ((trail & 0xC0) != 0x80) {
        throw ParseError(std::format("Invalid UTF-8 sequence at byte {}", i));
      }
      cp = (cp << 6) | (trail & 0x3F);
    }

    static constexpr char32_t minimum[] = {0, 0x80, 0x800, 0x10000};
    if (cp < minimum[extra] || cp > codePointMax || isLeadSurrogate(cp) ||
        isTrailSurrogate(cp)) {
      throw ParseError(std::format("Invalid UTF-8 code point at byte {}", i));
    }

    if (cp >= 0x10000) {
      cp -= 0x10000;
      appendUnit(out, static_cast<char16_t>(leadSurrogateMin + (cp >> 10)));
      appendUnit(out, static_cast<char16_t>(trailSurrogateMin + (cp & 0x3FF)));
    } else {
      appendUnit(out, static_cast<char16_t>(cp));
    }
    i += extra + 1;
  }

  return out;
}

std::string utf16leToUtf8(std::span<const uint8_t> bytes) {
  if (bytes.size() % 2 != 0) {
    throw ParseError(std::format("UTF-16 field has odd length {}", bytes.size()));
  }

  std::string out;
  size_t units = bytes.size() / 2;
  for (size_t i = 0; i < units; ++i) {
    char32_t cp = loadLE<uint16_t>(bytes.data() + i * 2);
    if (isLeadSurrogate(cp)) {
      if (i + 1 >= units) {
        throw ParseError(std::format("Unpaired UTF-16 surrogate at unit {}", i));
      }
      char32_t trail = loadLE<uint16_t>(bytes.data() + (i + 1) * 2);
      if (!isTrailSurrogate(trail)) {
        throw ParseError(std::format("Unpaired UTF-16 surrogate at unit {}", i));
      }
      cp = 0x10000 + ((cp - leadSurrogateMin) << 10) + (trail - trailSurrogateMin);
      ++i;
    } else if (isTrailSurrogate(cp)) {
      throw ParseError(std::format("Unpaired UTF-16 surrogate at unit {}", i));
    }
    appendUtf8(out, cp);
  }

  while (!out.empty() && out.back() == '\0') {
    out.pop_back();
  }
  return out;
}

std::vector<uint8_t> asciiToBytes(std::string_view text) {
  std::vector<uint8_t> out;
  out.reserve(text.size());
  for (char c : text) {
    auto byte = static_cast<uint8_t>(c);
    if (byte >= 0x80) {
      throw ParseError(std::format("Non-ASCII character 0x{:02x} in '{}'", byte, text));
    }
    out.push_back(byte);
  }
  return out;
}

std::string bytesToAscii(std::span<const uint8_t> bytes) {
  size_t length = bytes.size();
  while (length > 0 && bytes[length - 1] == 0) {
    --length;
  }

  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    if (bytes[i] >= 0x80) {
      throw ParseError(std::format("Non-ASCII byte 0x{:02x} at offset {}", bytes[i], i));
    }
    out += static_cast<char>(bytes[i]);
  }
  return out;
}

std::string toHex(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    out += std::format("{:02x}", byte);
  }
  return out;
}

std::vector<uint8_t> fromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw ParseError(std::format("Hex string has odd length {}", hex.size()));
  }

  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hexValue(hex[i]);
    int low = hexValue(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw ParseError(std::format("Invalid hex digit near offset {}", i));
    }
    out.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return out;
}

} // namespace sgax
