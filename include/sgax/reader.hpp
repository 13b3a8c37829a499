#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "archive_codec.hpp"
#include "metadata.hpp"
#include "types.hpp"

namespace sgax {

class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open SGA archive from file; the codec is chosen by the version in the file
  // Returns std::nullopt on failure, with error message in outError if provided
  static std::optional<Reader> open(const std::filesystem::path &path,
                                    std::string *outError = nullptr);

  // Same as open() for an archive image already in memory
  static std::optional<Reader> fromMemory(std::vector<uint8_t> data,
                                          std::string *outError = nullptr);

  const ArchiveRecords &records() const { return records_; }
  Version version() const { return records_.version; }
  const std::string &name() const { return records_.meta.name; }

  // Archive-level metadata (hash, footer fields)
  ArchiveMetadata metadata() const;

  size_t fileCount() const { return records_.files.size(); }
  size_t folderCount() const { return records_.folders.size(); }

  // Throws std::out_of_range for a bad index
  FileMetadata fileMetadata(size_t index) const;

  // Name table lookups
  // Returns std::nullopt on failure, with error message in outError if provided
  std::optional<std::string> fileName(size_t index, std::string *outError = nullptr) const;
  std::optional<std::string> folderName(size_t index, std::string *outError = nullptr) const;

  // Raw archive image the records were decoded from
  std::span<const uint8_t> bytes() const { return archiveData_; }

  bool isOpen() const { return codec_ != nullptr; }

  void close();

private:
  bool parse(std::string *outError);
  std::optional<std::string> lookupName(uint32_t offset, std::string *outError) const;

  std::vector<uint8_t> archiveData_;
  const ArchiveCodec *codec_ = nullptr;
  ArchiveRecords records_;
};

} // namespace sgax
