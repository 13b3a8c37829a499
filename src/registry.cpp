#include <algorithm>
#include <array>

#include <sgax/registry.hpp>

namespace sgax {

std::span<const ArchiveCodec> registeredCodecs() {
  static const std::array<ArchiveCodec, 1> codecs = {ArchiveCodec::makeV10()};
  return codecs;
}

const ArchiveCodec *findCodec(Version version) {
  auto codecs = registeredCodecs();
  auto it = std::find_if(codecs.begin(), codecs.end(),
                         [&](const ArchiveCodec &codec) { return codec.version() == version; });
  if (it == codecs.end()) {
    return nullptr;
  }
  return &*it;
}

} // namespace sgax
