#pragma once

#include <span>

#include "archive_codec.hpp"
#include "types.hpp"

namespace sgax {

// Fixed version -> codec table, built once on first use
std::span<const ArchiveCodec> registeredCodecs();

// Returns nullptr if no codec handles the version
const ArchiveCodec *findCodec(Version version);

} // namespace sgax
