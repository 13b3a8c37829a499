#include <format>
#include <iostream>
#include <variant>

#include <sgax/sgax.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.sga>\n";
    return 1;
  }

  std::string error;
  auto reader = sgax::Reader::open(argv[1], &error);

  if (!reader) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const auto &records = reader->records();
  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Version: " << reader->version().toString() << "\n";
  std::cout << "Name:    " << reader->name() << "\n";
  std::cout << std::format("TOC:     0x{:08x} ({} bytes)\n", records.meta.ptrs.headerPos,
                           records.meta.ptrs.headerSize);
  std::cout << std::format("Data:    0x{:08x} ({} bytes)\n", records.meta.ptrs.dataPos,
                           records.meta.ptrs.dataSize);
  std::cout << "Drives: " << records.drives.size() << ", Folders: " << records.folders.size()
            << ", Files: " << records.files.size() << "\n\n";

  for (const auto &[key, value] : reader->metadata().toProperties()) {
    std::cout << "  " << key << " = ";
    std::visit([](const auto &v) { std::cout << v; }, value);
    std::cout << "\n";
  }
  std::cout << "\n";

  for (const auto &drive : records.drives) {
    std::cout << "Drive '" << drive.alias << "' (" << drive.name << ")\n";
  }

  for (size_t i = 0; i < reader->folderCount(); ++i) {
    auto name = reader->folderName(i, &error);
    std::cout << "  [dir]  " << (name ? *name : "<" + error + ">") << "\n";
  }

  for (size_t i = 0; i < reader->fileCount(); ++i) {
    const auto &file = records.files[i];
    auto name = reader->fileName(i, &error);
    std::cout << std::format("  {:<40} {:>10} -> {:>10} bytes  {:<15} {:<8} {:<11} crc=0x{:08x}\n",
                             name ? *name : "<" + error + ">", file.lengthInArchive,
                             file.lengthOnDisk, sgax::toString(file.storage),
                             sgax::toString(file.encryption), sgax::toString(file.verification),
                             file.crc);
  }

  return 0;
}
