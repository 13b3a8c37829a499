#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archive_codec.hpp"
#include "metadata.hpp"
#include "types.hpp"

namespace sgax {

// Forward declarations
class Reader;
class Writer;

// High-level archive interface that combines reading and writing capabilities
class Archive {
public:
  Archive();
  ~Archive();

  // Delete copy, enable move
  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  // Open existing SGA archive for reading
  // Returns std::nullopt on failure, with error message in outError if provided
  static std::optional<Archive> open(const std::filesystem::path &path,
                                     std::string *outError = nullptr);

  // Create new SGA archive for writing
  static Archive create(Version version = {10, 0});

  // Start a writable copy of an opened archive, records included
  static std::optional<Archive> edit(const std::filesystem::path &path,
                                     std::string *outError = nullptr);

  // Replace the records to write (only available when writing)
  bool setRecords(ArchiveRecords records, std::string *outError = nullptr);

  // Write archive to disk (only available when writing)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr);

  // Decoded or pending records; empty records if the archive is closed
  const ArchiveRecords &records() const;

  // Archive-level metadata of the current records
  ArchiveMetadata metadata() const;

  size_t fileCount() const;

  // Check if archive is open for reading
  bool isReading() const { return reader_.get() != nullptr; }

  // Check if archive is open for writing
  bool isWriting() const { return writer_.get() != nullptr; }

  // Check if archive is open (either mode)
  bool isOpen() const { return isReading() || isWriting(); }

  // Close archive
  void close();

private:
  std::unique_ptr<Reader> reader_;
  std::unique_ptr<Writer> writer_;
};

} // namespace sgax
