#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "archive_codec.hpp"
#include "metadata.hpp"
#include "types.hpp"

namespace sgax {

class Writer {
public:
  // Starts from an empty archive with a placeholder meta block
  explicit Writer(Version version = {10, 0});
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Replace everything that will be written; the records' version selects the codec
  void setRecords(ArchiveRecords records) { records_ = std::move(records); }

  void setName(std::string name) { records_.meta.name = std::move(name); }

  // Apply archive-level metadata (hash and footer fields)
  // Returns true on success, false on failure (error in outError if provided)
  bool setMetadata(const ArchiveMetadata &metadata, std::string *outError = nullptr);

  // Encode to memory
  // Returns std::nullopt on failure, with error message in outError if provided
  std::optional<std::vector<uint8_t>> writeToMemory(std::string *outError = nullptr) const;

  // Write archive to disk
  // Returns true on success, false on failure (error in outError if provided)
  bool write(const std::filesystem::path &destPath, std::string *outError = nullptr) const;

  // Reset to an empty archive of the same version
  void clear();

  const ArchiveRecords &records() const { return records_; }

  size_t fileCount() const { return records_.files.size(); }

private:
  ArchiveRecords records_;
};

} // namespace sgax
