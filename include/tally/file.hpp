#pragma once

// tally/file.hpp — File loading.
//
// Files are read in 64 KiB chunks and, by default, delivered exactly as
// stored. Decompression is opt-in: only when the caller asks for it
// (Config::decompress) and the library is built with zstd (TALLY_WITH_ZSTD)
// is a file beginning with the zstd frame magic decoded on the fly, and then
// callers only ever see the decompressed bytes.
//
// Size cap: a file whose (delivered) contents exceed max_bytes is
// file_too_large. The cap is checked as bytes are produced, so a small
// compressed file that expands past the cap is rejected without buffering.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "tally/types.hpp"

namespace tally {

constexpr std::size_t kReadChunkSize = 64 * 1024;

struct FileContents {
  std::string filename;
  std::string data;
};

// Return false to stop reading early (not an error).
using ChunkFn = std::function<bool(std::string_view chunk)>;

// Streams the contents of path into fn. Returns false with *err set on
// file_not_found, file_unreadable, file_too_large or (only when decompress
// is set) decompression_failed.
bool for_each_chunk(const std::string& path, uint64_t max_bytes, bool decompress,
                    const ChunkFn& fn, Error* err);

// Whole-file read, capped at global_config().max_file_bytes and decoded
// according to global_config().decompress.
std::optional<FileContents> read_file(const std::string& path, Error* err);

}  // namespace tally
