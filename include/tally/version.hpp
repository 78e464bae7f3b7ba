#pragma once

// tally/version.hpp — Version manifest for every versioned surface.
//
// INVARIANT:
//   All version constants are compile-time. Hosts embedding the library
//   compare tally_abi_version() against the TALLY_ABI_VERSION they were built
//   with before making any other call; check_compatibility() is the C++ form
//   of that check.

#include <cstdint>
#include <string>

namespace tally {
namespace version {

// ---------------------------------------------------------------------------
// ABI_VERSION
// Increment when the C API (c_api.h) binary interface changes: a function
// signature, a struct layout, or an enumerator value. Must equal
// TALLY_ABI_VERSION in c_api.h.
// ---------------------------------------------------------------------------
constexpr uint32_t ABI_VERSION = 1;

// ---------------------------------------------------------------------------
// EVENT_LOG_VERSION
// Format of the JSONL event log lines written by observability.cpp.
// Adding or removing a field requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t EVENT_LOG_VERSION = 1;

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "1.0.0"
#endif

constexpr const char* SEMVER = PROJECT_VERSION;

struct VersionManifest {
  uint32_t abi{ABI_VERSION};
  uint32_t event_log{EVENT_LOG_VERSION};
  std::string semver;
  std::string hash_primitive;
  std::string hash_version;
  bool zstd{false};
  std::string build_timestamp;
};

VersionManifest current_manifest();

std::string manifest_to_json(const VersionManifest& m);

// "tally version <semver>"
std::string version_line();

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;
  std::string description;
  uint32_t required_abi{ABI_VERSION};
  uint32_t actual_abi{ABI_VERSION};
};

// Never throws.
CompatibilityResult check_compatibility(uint32_t caller_abi_version);

}  // namespace version
}  // namespace tally
