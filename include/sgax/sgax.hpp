#pragma once

// SGA Archive Codec Library
// A C++20 library for decoding and encoding the structural records of Relic's
// SGA archive format, version 10.0.

#include "archive.hpp"
#include "archive_codec.hpp"
#include "codecs.hpp"
#include "metadata.hpp"
#include "reader.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "writer.hpp"

// The library provides three levels of abstraction:
//
// 1. Record codecs: MetaBlockCodec, TocHeaderCodec, TocFooterCodec,
//    FileDefCodec, DriveDefCodec, FolderDefCodec
//    - Convert one fixed-width record at a time, throwing on malformed input
//    - ArchiveCodec bundles them for one version; findCodec() picks it by version
//
// 2. Low-level: Reader / Writer classes
//    - Use Reader::open() to decode an existing archive
//    - Use Writer to encode records back into an archive
//
// 3. High-level: Archive class
//    - Unified interface for both reading and writing
//
// Example usage:
//
//   // Reading an archive
//   auto archive = sgax::Archive::open("EngineArtHigh.sga");
//   if (archive) {
//     auto meta = archive->metadata();
//     std::cout << meta.sha256Hex << std::endl;
//   }
//
//   // Re-encoding an archive
//   auto copy = sgax::Archive::edit("EngineArtHigh.sga");
//   copy->write("copy.sga");

namespace sgax {}
