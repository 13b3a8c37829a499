#include <sgax/archive.hpp>
#include <sgax/reader.hpp>
#include <sgax/writer.hpp>

namespace sgax {

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, std::string *outError) {
  auto reader = Reader::open(path, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

Archive Archive::create(Version version) {
  Archive archive;
  archive.writer_ = std::make_unique<Writer>(version);
  return archive;
}

std::optional<Archive> Archive::edit(const std::filesystem::path &path, std::string *outError) {
  auto reader = Reader::open(path, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.writer_ = std::make_unique<Writer>(reader->version());
  archive.writer_->setRecords(reader->records());
  return archive;
}

bool Archive::setRecords(ArchiveRecords records, std::string *outError) {
  if (!writer_) {
    if (outError) {
      *outError = "Archive not open for writing";
    }
    return false;
  }
  writer_->setRecords(std::move(records));
  return true;
}

bool Archive::write(const std::filesystem::path &destPath, std::string *outError) {
  if (!writer_) {
    if (outError) {
      *outError = "Archive not open for writing";
    }
    return false;
  }
  return writer_->write(destPath, outError);
}

const ArchiveRecords &Archive::records() const {
  static const ArchiveRecords empty;
  if (reader_) {
    return reader_->records();
  }
  if (writer_) {
    return writer_->records();
  }
  return empty;
}

ArchiveMetadata Archive::metadata() const {
  const auto &current = records();
  return assembleMeta(current.meta, current.footer);
}

size_t Archive::fileCount() const {
  return records().files.size();
}

void Archive::close() {
  reader_.reset();
  writer_.reset();
}

} // namespace sgax
