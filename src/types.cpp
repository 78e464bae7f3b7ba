#include "tally/types.hpp"

namespace tally {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::usage_missing_command: return "usage_missing_command";
    case ErrorCode::usage_unknown_command: return "usage_unknown_command";
    case ErrorCode::usage_missing_filename: return "usage_missing_filename";
    case ErrorCode::usage_unknown_flag: return "usage_unknown_flag";
    case ErrorCode::usage_conflicting_flags: return "usage_conflicting_flags";
    case ErrorCode::file_not_found: return "file_not_found";
    case ErrorCode::file_unreadable: return "file_unreadable";
    case ErrorCode::file_too_large: return "file_too_large";
    case ErrorCode::decompression_failed: return "decompression_failed";
    case ErrorCode::invalid_utf8: return "invalid_utf8";
    case ErrorCode::invalid_argument: return "invalid_argument";
    case ErrorCode::abi_version_mismatch: return "abi_version_mismatch";
    case ErrorCode::internal_error: return "internal_error";
    case ErrorCode::out_of_memory: return "out_of_memory";
  }
  return "internal_error";
}

std::string to_string(Command command) {
  switch (command) {
    case Command::version: return "version";
    case Command::bytes: return "bytes";
    case Command::characters: return "characters";
  }
  return "";
}

ErrorClass classify(ErrorCode code) {
  const auto v = static_cast<uint32_t>(code);
  if (v == 0) return ErrorClass::none;
  if (v >= 10 && v < 20) return ErrorClass::usage;
  if (v >= 20 && v < 30) return ErrorClass::io;
  if (v >= 30 && v < 40) return ErrorClass::decoding;
  return ErrorClass::internal;
}

std::optional<Command> parse_command(std::string_view word) {
  if (word == "version") return Command::version;
  if (word == "bytes") return Command::bytes;
  if (word == "characters") return Command::characters;
  return std::nullopt;
}

}  // namespace tally
