#include <format>
#include <fstream>
#include <stdexcept>

#include <sgax/reader.hpp>
#include <sgax/registry.hpp>

namespace sgax {

std::optional<Reader> Reader::open(const std::filesystem::path &path, std::string *outError) {
  std::error_code ec;
  auto fileSize = std::filesystem::file_size(path, ec);
  if (ec) {
    if (outError) {
      *outError = std::format("Failed to open archive: {} ({})", path.string(), ec.message());
    }
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (outError) {
      *outError = std::format("Failed to open archive: {}", path.string());
    }
    return std::nullopt;
  }

  std::vector<uint8_t> data(fileSize);
  if (!in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(fileSize))) {
    if (outError) {
      *outError = std::format("Failed to read archive: {}", path.string());
    }
    return std::nullopt;
  }

  return fromMemory(std::move(data), outError);
}

std::optional<Reader> Reader::fromMemory(std::vector<uint8_t> data, std::string *outError) {
  Reader reader;
  reader.archiveData_ = std::move(data);

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

bool Reader::parse(std::string *outError) {
  try {
    ByteReader stream(archiveData_);
    Version version = readVersion(stream);

    const ArchiveCodec *codec = findCodec(version);
    if (!codec) {
      if (outError) {
        *outError = std::format("Unsupported SGA version {}", version.toString());
      }
      return false;
    }

    stream.seek(0);
    records_ = codec->decode(stream);
    codec_ = codec;
  } catch (const ParseError &e) {
    if (outError) {
      *outError = std::format("Invalid SGA archive: {}", e.what());
    }
    return false;
  } catch (const IoError &e) {
    if (outError) {
      *outError = std::format("Truncated SGA archive: {}", e.what());
    }
    return false;
  }

  return true;
}

ArchiveMetadata Reader::metadata() const {
  return assembleMeta(records_.meta, records_.footer);
}

FileMetadata Reader::fileMetadata(size_t index) const {
  return buildFileMeta(records_.files.at(index));
}

std::optional<std::string> Reader::fileName(size_t index, std::string *outError) const {
  if (index >= records_.files.size()) {
    if (outError) {
      *outError = std::format("File index {} out of range (count: {})", index,
                              records_.files.size());
    }
    return std::nullopt;
  }
  return lookupName(records_.files[index].namePos, outError);
}

std::optional<std::string> Reader::folderName(size_t index, std::string *outError) const {
  if (index >= records_.folders.size()) {
    if (outError) {
      *outError = std::format("Folder index {} out of range (count: {})", index,
                              records_.folders.size());
    }
    return std::nullopt;
  }
  return lookupName(records_.folders[index].namePos, outError);
}

std::optional<std::string> Reader::lookupName(uint32_t offset, std::string *outError) const {
  try {
    return nameAt(records_.names, offset);
  } catch (const ParseError &e) {
    if (outError) {
      *outError = e.what();
    }
    return std::nullopt;
  }
}

void Reader::close() {
  archiveData_.clear();
  codec_ = nullptr;
  records_ = ArchiveRecords{};
}

} // namespace sgax
