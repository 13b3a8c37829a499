#include <algorithm>
#include <fstream>
#include <iostream>

#include <sgax/sgax.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <input.sga> <output.sga>\n";
    return 1;
  }

  std::string error;
  auto reader = sgax::Reader::open(argv[1], &error);
  if (!reader) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  sgax::Writer writer(reader->version());
  writer.setRecords(reader->records());

  auto encoded = writer.writeToMemory(&error);
  if (!encoded) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::ofstream out(argv[2], std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(encoded->data()),
            static_cast<std::streamsize>(encoded->size()));
  if (!out) {
    std::cerr << "Error: failed to write " << argv[2] << "\n";
    return 1;
  }

  auto original = reader->bytes();
  bool identical = std::equal(original.begin(), original.end(), encoded->begin(), encoded->end());

  std::cout << "Wrote " << encoded->size() << " bytes to " << argv[2] << "\n";
  std::cout << (identical ? "Output is byte-identical to the input\n"
                          : "Output differs from the input (pointers or padding were recomputed)\n");
  return 0;
}
