#pragma once

// tally/config.hpp — Runtime configuration.
//
// SOURCES (later wins):
//   1. Built-in defaults.
//   2. Environment: TALLY_EVENT_LOG, TALLY_MAX_FILE_BYTES, TALLY_DIGEST,
//      TALLY_DECOMPRESS.
//   3. JSON passed to tally_configure() by an embedding host:
//        {"event_log_path": "...", "max_file_bytes": 1048576, "digest": false,
//         "decompress": true}
//
// Unknown keys are ignored. A key that is present with a malformed value is
// an invalid_argument error and leaves the configuration unchanged.

#include <cstdint>
#include <optional>
#include <string>

#include "tally/types.hpp"

namespace tally {

struct Config {
  std::string event_log_path;                       // empty = no event log
  uint64_t max_file_bytes{256ull * 1024 * 1024};    // per file, after decompression
  bool digest{true};                                // BLAKE3 digests in events/output
  bool decompress{false};                           // count zstd frames decoded (zstd builds only)
};

// Defaults overlaid with the environment. Malformed environment values are
// ignored (the default stays).
Config load_config_from_env();

// base overlaid with the keys present in json.
std::optional<Config> parse_config_json(const std::string& json, const Config& base, Error* err);

// Process-wide configuration. Initialized from load_config_from_env() on
// first use.
Config global_config();
void set_global_config(const Config& config);

}  // namespace tally
