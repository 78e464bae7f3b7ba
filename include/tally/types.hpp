#pragma once

// tally/types.hpp — Core value types shared by every tally module.
//
// MEMORY OWNERSHIP:
//   - All types here are value types. String members are value-owned.
//   - Nothing in this header crosses the C ABI directly; c_api.h carries the
//     C renderings (tally_command_t, tally_file_mode_t, tally_status_t) and
//     c_api.cpp maps between the two. Enumerator values are kept identical
//     so the mapping is a static_cast.
//
// ERROR MODEL:
//   Domain failures never throw. Functions that can fail return a value type
//   (std::optional or a result struct) and report the failure through an
//   Error out-parameter. Only allocation failure escapes as an exception, and
//   the C ABI layer converts it to TALLY_ERROR_OUT_OF_MEMORY.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tally {

// Values 0..2 are frozen: they are shared with tally_command_t.
enum class Command : uint32_t {
  version = 0,
  bytes = 1,
  characters = 2,
};

// Values 0..2 are frozen: they are shared with tally_file_mode_t.
enum class FileMode : uint32_t {
  normal = 0,
  csv_list = 1,
  csv_merged = 2,
};

// Values are frozen: they are shared with tally_status_t.
// Ranges: 10s usage, 20s I/O, 30s decoding, 40s boundary.
enum class ErrorCode : uint32_t {
  none = 0,

  usage_missing_command = 10,
  usage_unknown_command = 11,
  usage_missing_filename = 12,
  usage_unknown_flag = 13,
  usage_conflicting_flags = 14,

  file_not_found = 20,
  file_unreadable = 21,
  file_too_large = 22,
  decompression_failed = 23,

  invalid_utf8 = 30,

  invalid_argument = 40,
  abi_version_mismatch = 41,
  internal_error = 42,
  out_of_memory = 43,
};

enum class ErrorClass {
  none,
  usage,
  io,
  decoding,
  internal,
};

std::string to_string(ErrorCode code);
std::string to_string(Command command);

ErrorClass classify(ErrorCode code);

// Parses a command word ("version", "bytes", "characters").
std::optional<Command> parse_command(std::string_view word);

struct Error {
  ErrorCode code{ErrorCode::none};
  std::string detail;

  explicit operator bool() const { return code != ErrorCode::none; }
};

// Writes code/detail into *err when err is non-null. Always returns
// std::nullopt so callers can `return fail(err, ...)`.
inline std::nullopt_t fail(Error* err, ErrorCode code, std::string detail) {
  if (err) {
    err->code = code;
    err->detail = std::move(detail);
  }
  return std::nullopt;
}

struct Arguments {
  Command command{Command::version};
  std::optional<std::string> filename;  // unset only for Command::version
  std::size_t filename_index{0};        // position of filename in argv
  FileMode file_mode{FileMode::normal};
  bool json{false};
};

// Result of counting one source (a file, or the merged CSV contents).
struct Measurement {
  Command command{Command::bytes};
  uint64_t count{0};
  uint64_t bytes{0};          // raw bytes consumed (after decompression)
  std::string digest;         // BLAKE3 hex of the counted bytes; empty if disabled
};

}  // namespace tally
