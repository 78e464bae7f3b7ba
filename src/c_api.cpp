#include "tally/c_api.h"

// Stable C ABI implementation.
//
// This file wraps the C++ API behind a pure-C boundary. Key invariants:
//   - No C++ types cross the ABI boundary.
//   - All output strings are malloc'd copies, freed via tally_free_string().
//   - All exceptions are caught here and reported as TALLY_ERROR_OUT_OF_MEMORY
//     or TALLY_ERROR_INTERNAL; callers never see a C++ exception.
//   - tally_counter_t is a heap-allocated opaque struct owned by the caller
//     between tally_counter_new() and tally_counter_free().

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <new>
#include <string>
#include <vector>

#include "tally/args.hpp"
#include "tally/config.hpp"
#include "tally/counting.hpp"
#include "tally/csv.hpp"
#include "tally/file.hpp"
#include "tally/observability.hpp"
#include "tally/runtime.hpp"
#include "tally/version.hpp"

static_assert(TALLY_ABI_VERSION == tally::version::ABI_VERSION,
              "c_api.h and version.hpp disagree on the ABI version");
static_assert(static_cast<int>(tally::Command::characters) == TALLY_COMMAND_CHARACTERS);
static_assert(static_cast<int>(tally::FileMode::csv_merged) == TALLY_FILE_MODE_CSV_MERGED);
static_assert(static_cast<int>(tally::ErrorCode::usage_conflicting_flags) == TALLY_ERROR_CONFLICTING_FLAGS);
static_assert(static_cast<int>(tally::ErrorCode::decompression_failed) == TALLY_ERROR_DECOMPRESSION);
static_assert(static_cast<int>(tally::ErrorCode::invalid_utf8) == TALLY_ERROR_INVALID_UTF8);
static_assert(static_cast<int>(tally::ErrorCode::out_of_memory) == TALLY_ERROR_OUT_OF_MEMORY);

// ---------------------------------------------------------------------------
// Opaque counter struct
// ---------------------------------------------------------------------------
struct tally_counter {
  explicit tally_counter(tally::Command command) : counter(command) {}
  tally::Counter counter;
};

namespace {

// malloc'd, NUL-terminated copy of len bytes. NULL on allocation failure.
char* dup_bytes(const char* data, std::size_t len) {
  auto* out = static_cast<char*>(std::malloc(len + 1));
  if (!out) return nullptr;
  if (len > 0) std::memcpy(out, data, len);
  out[len] = '\0';
  return out;
}

char* dup_string(const std::string& s) {
  return dup_bytes(s.data(), s.size());
}

void set_error(char** out_error, const std::string& message) {
  if (out_error) *out_error = dup_string(message);
}

void clear_error(char** out_error) {
  if (out_error) *out_error = nullptr;
}

tally_status_t to_status(tally::ErrorCode code) {
  return static_cast<tally_status_t>(code);
}

tally_status_t report(const tally::Error& err, char** out_error) {
  set_error(out_error, err.detail);
  return to_status(err.code);
}

bool valid_command(tally_command_t command) {
  return command == TALLY_COMMAND_BYTES || command == TALLY_COMMAND_CHARACTERS;
}

void fill_measurement(const tally::Measurement& m, tally_measurement_t* out) {
  out->count = m.count;
  out->bytes = m.bytes;
  const std::size_t n = m.digest.size() < TALLY_DIGEST_HEX_LEN ? m.digest.size() : TALLY_DIGEST_HEX_LEN;
  std::memcpy(out->digest, m.digest.data(), n);
  out->digest[n] = '\0';
}

// Runs fn, converting any escaping exception into a status.
template <typename Fn>
tally_status_t guarded(char** out_error, Fn&& fn) {
  try {
    return fn();
  } catch (const std::bad_alloc&) {
    set_error(out_error, "out of memory");
    return TALLY_ERROR_OUT_OF_MEMORY;
  } catch (const std::exception& e) {
    set_error(out_error, e.what());
    return TALLY_ERROR_INTERNAL;
  } catch (...) {
    set_error(out_error, "unknown exception");
    return TALLY_ERROR_INTERNAL;
  }
}

}  // namespace

extern "C" {

const char* tally_status_name(tally_status_t status) {
  switch (status) {
    case TALLY_OK: return "ok";
    case TALLY_ERROR_MISSING_COMMAND: return "usage_missing_command";
    case TALLY_ERROR_UNKNOWN_COMMAND: return "usage_unknown_command";
    case TALLY_ERROR_MISSING_FILENAME: return "usage_missing_filename";
    case TALLY_ERROR_UNKNOWN_FLAG: return "usage_unknown_flag";
    case TALLY_ERROR_CONFLICTING_FLAGS: return "usage_conflicting_flags";
    case TALLY_ERROR_FILE_NOT_FOUND: return "file_not_found";
    case TALLY_ERROR_FILE_UNREADABLE: return "file_unreadable";
    case TALLY_ERROR_FILE_TOO_LARGE: return "file_too_large";
    case TALLY_ERROR_DECOMPRESSION: return "decompression_failed";
    case TALLY_ERROR_INVALID_UTF8: return "invalid_utf8";
    case TALLY_ERROR_INVALID_ARGUMENT: return "invalid_argument";
    case TALLY_ERROR_ABI_MISMATCH: return "abi_version_mismatch";
    case TALLY_ERROR_INTERNAL: return "internal_error";
    case TALLY_ERROR_OUT_OF_MEMORY: return "out_of_memory";
  }
  return "unknown_status";
}

// --- Version ----------------------------------------------------------------

uint32_t tally_abi_version(void) {
  return TALLY_ABI_VERSION;
}

tally_status_t tally_check_abi(uint32_t caller_abi_version) {
  return tally::version::check_compatibility(caller_abi_version).ok ? TALLY_OK
                                                                    : TALLY_ERROR_ABI_MISMATCH;
}

const char* tally_version_string(void) {
  static const std::string line = tally::version::version_line();
  return line.c_str();
}

void tally_print_version(void) {
  std::printf("%s\n", tally_version_string());
  std::fflush(stdout);
}

char* tally_version_manifest_json(void) {
  try {
    return dup_string(tally::version::manifest_to_json(tally::version::current_manifest()));
  } catch (const std::exception&) {
    return nullptr;
  }
}

// --- Configuration ----------------------------------------------------------

tally_status_t tally_configure(const char* config_json, char** out_error) {
  clear_error(out_error);
  if (!config_json) {
    set_error(out_error, "config_json is NULL");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }
  return guarded(out_error, [&] {
    tally::Error err;
    auto cfg = tally::parse_config_json(config_json, tally::global_config(), &err);
    if (!cfg) return report(err, out_error);
    tally::set_global_config(*cfg);
    return TALLY_OK;
  });
}

// --- Arguments --------------------------------------------------------------

tally_status_t tally_parse_args(size_t argc, const char* const* argv,
                                tally_arguments_t* out, char** out_error) {
  clear_error(out_error);
  if (!out || (argc > 0 && !argv)) {
    set_error(out_error, "argv or out is NULL");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }
  std::memset(out, 0, sizeof(*out));

  return guarded(out_error, [&] {
    std::vector<std::string_view> args;
    args.reserve(argc);
    for (size_t i = 0; i < argc; ++i) args.emplace_back(argv[i] ? argv[i] : "");

    tally::Error err;
    auto parsed = tally::parse_args(args, &err);
    if (!parsed) return report(err, out_error);

    out->command = static_cast<tally_command_t>(parsed->command);
    // Borrow the file operand from argv rather than copy it.
    out->filename = parsed->filename ? argv[parsed->filename_index] : nullptr;
    out->file_mode = static_cast<tally_file_mode_t>(parsed->file_mode);
    out->json = parsed->json ? 1 : 0;
    return TALLY_OK;
  });
}

// --- Counting ---------------------------------------------------------------

uint64_t tally_count_bytes(const char* text) {
  if (!text) return 0;
  return tally::count_bytes(std::string_view(text));
}

uint64_t tally_count_bytes_n(const void* data, size_t length) {
  if (!data) return 0;
  return static_cast<uint64_t>(length);
}

uint64_t tally_count_characters_n(const void* data, size_t length, tally_status_t* out_status) {
  if (out_status) *out_status = TALLY_OK;
  if (!data) {
    if (out_status) *out_status = TALLY_ERROR_INVALID_ARGUMENT;
    return 0;
  }
  uint64_t count = 0;
  const tally_status_t status = guarded(nullptr, [&] {
    tally::Error err;
    auto n = tally::count_characters(std::string_view(static_cast<const char*>(data), length), &err);
    if (!n) return to_status(err.code);
    count = *n;
    return TALLY_OK;
  });
  if (out_status) *out_status = status;
  return status == TALLY_OK ? count : 0;
}

uint64_t tally_count_characters(const char* text, tally_status_t* out_status) {
  if (!text) {
    if (out_status) *out_status = TALLY_ERROR_INVALID_ARGUMENT;
    return 0;
  }
  return tally_count_characters_n(text, std::strlen(text), out_status);
}

tally_status_t tally_measure(tally_command_t command, const void* data, size_t length,
                             const char* source, tally_measurement_t* out,
                             char** out_error) {
  clear_error(out_error);
  if (!out || (!data && length > 0) || !valid_command(command)) {
    set_error(out_error, "invalid command, data or out");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }
  return guarded(out_error, [&] {
    tally::Error err;
    const std::string_view bytes(data ? static_cast<const char*>(data) : "", length);
    auto m = tally::measure_text(static_cast<tally::Command>(command), bytes,
                                 source ? source : "", &err);
    if (!m) return report(err, out_error);
    fill_measurement(*m, out);
    return TALLY_OK;
  });
}

tally_status_t tally_measure_file(tally_command_t command, const char* filename,
                                  tally_measurement_t* out, char** out_error) {
  clear_error(out_error);
  if (!out || !filename || !valid_command(command)) {
    set_error(out_error, "invalid command, filename or out");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }
  return guarded(out_error, [&] {
    tally::Error err;
    auto m = tally::measure_file(static_cast<tally::Command>(command), filename, &err);
    if (!m) return report(err, out_error);
    fill_measurement(*m, out);
    return TALLY_OK;
  });
}

// --- Streaming counter ------------------------------------------------------

tally_counter_t* tally_counter_new(tally_command_t command) {
  if (!valid_command(command)) return nullptr;
  return new (std::nothrow) tally_counter(static_cast<tally::Command>(command));
}

tally_status_t tally_counter_feed(tally_counter_t* counter, const void* data, size_t length) {
  if (!counter || (!data && length > 0)) return TALLY_ERROR_INVALID_ARGUMENT;
  if (length == 0) return TALLY_OK;
  // A rejected chunk records its error detail, which allocates.
  return guarded(nullptr, [&] {
    if (!counter->counter.feed(std::string_view(static_cast<const char*>(data), length))) {
      return TALLY_ERROR_INVALID_UTF8;
    }
    return TALLY_OK;
  });
}

tally_status_t tally_counter_finish(const tally_counter_t* counter, uint64_t* out_count) {
  if (!counter || !out_count) return TALLY_ERROR_INVALID_ARGUMENT;
  return guarded(nullptr, [&] {
    tally::Error err;
    auto n = counter->counter.finish(&err);
    if (!n) return to_status(err.code);
    *out_count = *n;
    return TALLY_OK;
  });
}

void tally_counter_free(tally_counter_t* counter) {
  delete counter;
}

// --- Files ------------------------------------------------------------------

tally_status_t tally_file_read(const char* filename, tally_file_t* out, char** out_error) {
  clear_error(out_error);
  if (!filename || !out) {
    set_error(out_error, "filename or out is NULL");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }
  std::memset(out, 0, sizeof(*out));

  return guarded(out_error, [&] {
    tally::Error err;
    auto contents = tally::read_file(filename, &err);
    if (!contents) return report(err, out_error);

    char* data = dup_string(contents->data);
    if (!data) {
      set_error(out_error, "out of memory");
      return TALLY_ERROR_OUT_OF_MEMORY;
    }
    out->filename = filename;
    out->data = reinterpret_cast<uint8_t*>(data);
    out->length = contents->data.size();
    return TALLY_OK;
  });
}

char* tally_file_to_string(const tally_file_t* file) {
  if (!file || (!file->data && file->length > 0)) return nullptr;
  if (!file->data) return dup_bytes("", 0);
  return dup_bytes(reinterpret_cast<const char*>(file->data), file->length);
}

void tally_file_free(tally_file_t* file) {
  if (!file) return;
  std::free(file->data);
  file->data = nullptr;
  file->length = 0;
}

// --- CSV lists --------------------------------------------------------------

tally_status_t tally_csv_for_each_value(const char* csv, tally_value_callback callback,
                                        void* context) {
  if (!csv || !callback) return TALLY_ERROR_INVALID_ARGUMENT;
  return guarded(nullptr, [&] {
    tally::for_each_value(csv, [&](const std::string& value) {
      return callback(value.c_str(), context) == 0;
    });
    return TALLY_OK;
  });
}

char* tally_csv_merge_files(char* csv, tally_release_fn release_csv, size_t* out_length,
                            tally_status_t* out_status, char** out_error) {
  clear_error(out_error);
  if (out_length) *out_length = 0;
  if (!csv || !release_csv) {
    // Ownership was handed over; honor it even on a bad call.
    if (csv && release_csv) release_csv(csv);
    if (out_status) *out_status = TALLY_ERROR_INVALID_ARGUMENT;
    set_error(out_error, "csv or release_csv is NULL");
    return nullptr;
  }

  char* result = nullptr;
  const tally_status_t status = guarded(out_error, [&] {
    tally::Error err;
    auto merged = tally::merge_files(csv, &err);
    if (!merged) return report(err, out_error);
    result = dup_string(*merged);
    if (!result) {
      set_error(out_error, "out of memory");
      return TALLY_ERROR_OUT_OF_MEMORY;
    }
    if (out_length) *out_length = merged->size();
    return TALLY_OK;
  });

  release_csv(csv);
  if (out_status) *out_status = status;
  return result;
}

tally_status_t tally_measure_merged(tally_command_t command, char* csv,
                                    tally_release_fn release_csv,
                                    tally_measurement_t* out, char** out_error) {
  clear_error(out_error);
  if (!csv || !release_csv || !out || !valid_command(command)) {
    if (csv && release_csv) release_csv(csv);
    set_error(out_error, "invalid command, csv, release_csv or out");
    return TALLY_ERROR_INVALID_ARGUMENT;
  }

  const tally_status_t status = guarded(out_error, [&] {
    tally::Error err;
    auto m = tally::measure_merged(static_cast<tally::Command>(command), csv, &err);
    if (!m) return report(err, out_error);
    fill_measurement(*m, out);
    return TALLY_OK;
  });

  release_csv(csv);
  return status;
}

// --- Observability ----------------------------------------------------------

char* tally_stats_json(void) {
  try {
    return dup_string(tally::global_count_stats().to_json());
  } catch (const std::exception&) {
    return nullptr;
  }
}

// --- Memory -----------------------------------------------------------------

void tally_free_string(char* s) {
  // OWNERSHIP: s was allocated with malloc() in this compilation unit.
  std::free(s);
}

}  // extern "C"
