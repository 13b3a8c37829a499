#include <format>
#include <fstream>
#include <stdexcept>

#include <sgax/registry.hpp>
#include <sgax/writer.hpp>

namespace sgax {

Writer::Writer(Version version) {
  records_.version = version;
  records_.meta = MetaBlock::makeDefault();
}

bool Writer::setMetadata(const ArchiveMetadata &metadata, std::string *outError) {
  const ArchiveCodec *codec = findCodec(records_.version);
  if (!codec) {
    if (outError) {
      *outError = std::format("Unsupported SGA version {}", records_.version.toString());
    }
    return false;
  }

  try {
    auto [meta, footer] = codec->disassembleMeta(metadata);
    records_.meta.sha256 = std::move(meta.sha256);
    records_.footer = footer;
  } catch (const ParseError &e) {
    if (outError) {
      *outError = std::format("Invalid archive metadata: {}", e.what());
    }
    return false;
  }

  return true;
}

std::optional<std::vector<uint8_t>> Writer::writeToMemory(std::string *outError) const {
  const ArchiveCodec *codec = findCodec(records_.version);
  if (!codec) {
    if (outError) {
      *outError = std::format("Unsupported SGA version {}", records_.version.toString());
    }
    return std::nullopt;
  }

  ByteWriter stream;
  try {
    codec->encode(stream, records_);
  } catch (const ParseError &e) {
    if (outError) {
      *outError = std::format("Failed to encode archive: {}", e.what());
    }
    return std::nullopt;
  } catch (const std::length_error &e) {
    if (outError) {
      *outError = std::format("Failed to encode archive: {}", e.what());
    }
    return std::nullopt;
  }

  return stream.release();
}

bool Writer::write(const std::filesystem::path &destPath, std::string *outError) const {
  auto encoded = writeToMemory(outError);
  if (!encoded) {
    return false;
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to create output file: {}", destPath.string());
    }
    return false;
  }

  out.write(reinterpret_cast<const char *>(encoded->data()),
            static_cast<std::streamsize>(encoded->size()));
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to write to output file: {}", destPath.string());
    }
    return false;
  }

  return true;
}

void Writer::clear() {
  Version version = records_.version;
  records_ = ArchiveRecords{};
  records_.version = version;
  records_.meta = MetaBlock::makeDefault();
}

} // namespace sgax
