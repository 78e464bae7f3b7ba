/*
 * tally/c_api.h — Stable C ABI for the tally counting library.
 *
 * Everything a host needs (C, Rust, Go, Python ctypes, ...) is declared here.
 * No C++ type, exception or STL container crosses this boundary. The tally
 * command-line program is itself written against this header only.
 *
 * OWNERSHIP CONTRACT:
 *   - Caller owns all INPUT strings, except the `csv` argument of
 *     tally_csv_merge_files(), whose ownership passes to the library (see
 *     there).
 *   - Every char* returned by this API, and every `*out_error` message, is
 *     heap-allocated by the library. Free it with tally_free_string() and
 *     nothing else.
 *   - tally_file_t::data is library-allocated; release it with
 *     tally_file_free().
 *   - const char* returned by tally_version_string() and tally_status_name()
 *     are static. Never free them.
 *   - tally_counter_t is opaque. Never dereference or copy; release with
 *     tally_counter_free().
 *   - Borrowed pointers stored in transparent structs (tally_arguments_t,
 *     tally_file_t::filename) point into caller memory and live as long as
 *     that memory does.
 *
 * ERROR REPORTING:
 *   Fallible functions return tally_status_t. When `out_error` is non-NULL it
 *   receives a human-readable message on failure (free with
 *   tally_free_string) and NULL on success.
 *
 * ABI VERSIONING:
 *   Compare tally_abi_version() with TALLY_ABI_VERSION before any other call,
 *   or call tally_check_abi(TALLY_ABI_VERSION). Enumerator values and struct
 *   layouts below are part of the ABI.
 *
 * THREAD SAFETY:
 *   Every function may be called from any thread. tally_configure() changes
 *   process-wide settings. A tally_counter_t must not be used from two
 *   threads at once.
 *
 * EXAMPLE (C):
 *   tally_measurement_t m;
 *   char* err = NULL;
 *   if (tally_measure_file(TALLY_COMMAND_CHARACTERS, "a.txt", &m, &err) != TALLY_OK) {
 *     fprintf(stderr, "%s\n", err);
 *     tally_free_string(err);
 *   } else {
 *     printf("%llu\n", (unsigned long long)m.count);
 *   }
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Current C ABI version. Bump on any breaking change. */
#define TALLY_ABI_VERSION 1

/* Length of a BLAKE3 hex digest, excluding the terminating NUL. */
#define TALLY_DIGEST_HEX_LEN 64

/* ------------------------------------------------------------------------
 * Shared enums
 * ------------------------------------------------------------------------ */

typedef enum tally_command {
  TALLY_COMMAND_VERSION = 0,
  TALLY_COMMAND_BYTES = 1,
  TALLY_COMMAND_CHARACTERS = 2
} tally_command_t;

typedef enum tally_file_mode {
  TALLY_FILE_MODE_NORMAL = 0,
  TALLY_FILE_MODE_CSV_LIST = 1,
  TALLY_FILE_MODE_CSV_MERGED = 2
} tally_file_mode_t;

/* 10s usage, 20s I/O, 30s decoding, 40s boundary/internal. */
typedef enum tally_status {
  TALLY_OK = 0,

  TALLY_ERROR_MISSING_COMMAND = 10,
  TALLY_ERROR_UNKNOWN_COMMAND = 11,
  TALLY_ERROR_MISSING_FILENAME = 12,
  TALLY_ERROR_UNKNOWN_FLAG = 13,
  TALLY_ERROR_CONFLICTING_FLAGS = 14,

  TALLY_ERROR_FILE_NOT_FOUND = 20,
  TALLY_ERROR_FILE_UNREADABLE = 21,
  TALLY_ERROR_FILE_TOO_LARGE = 22,
  TALLY_ERROR_DECOMPRESSION = 23,

  TALLY_ERROR_INVALID_UTF8 = 30,

  TALLY_ERROR_INVALID_ARGUMENT = 40,
  TALLY_ERROR_ABI_MISMATCH = 41,
  TALLY_ERROR_INTERNAL = 42,
  TALLY_ERROR_OUT_OF_MEMORY = 43
} tally_status_t;

/* Static, never NULL. "ok" for TALLY_OK. */
const char* tally_status_name(tally_status_t status);

/* ------------------------------------------------------------------------
 * Transparent structs
 * ------------------------------------------------------------------------ */

typedef struct tally_arguments {
  tally_command_t command;
  const char* filename;      /* borrowed from argv; NULL for version */
  tally_file_mode_t file_mode;
  int json;                  /* non-zero when --json was given */
} tally_arguments_t;

typedef struct tally_file {
  const char* filename;      /* borrowed from the caller */
  uint8_t* data;             /* library-owned; NUL-terminated past length */
  size_t length;
} tally_file_t;

typedef struct tally_measurement {
  uint64_t count;
  uint64_t bytes;
  char digest[TALLY_DIGEST_HEX_LEN + 1];  /* "" when digests are disabled */
} tally_measurement_t;

/* ------------------------------------------------------------------------
 * Version
 * ------------------------------------------------------------------------ */

uint32_t tally_abi_version(void);

/* TALLY_OK or TALLY_ERROR_ABI_MISMATCH. */
tally_status_t tally_check_abi(uint32_t caller_abi_version);

/* "tally version <semver>" (static). */
const char* tally_version_string(void);

/* Writes tally_version_string() and a newline to stdout. */
void tally_print_version(void);

/* Version manifest as JSON. Free with tally_free_string. */
char* tally_version_manifest_json(void);

/* ------------------------------------------------------------------------
 * Configuration
 * ------------------------------------------------------------------------ */

/*
 * tally_configure — overlay process settings with a JSON object:
 *   {"event_log_path": "...", "max_file_bytes": N, "digest": true|false,
 *    "decompress": true|false}
 * Unknown keys are ignored. On error nothing changes.
 */
tally_status_t tally_configure(const char* config_json, char** out_error);

/* ------------------------------------------------------------------------
 * Arguments
 * ------------------------------------------------------------------------ */

/*
 * tally_parse_args — validate a command line (argv[0] = program name).
 * On success *out is filled; on failure *out is left zeroed.
 */
tally_status_t tally_parse_args(size_t argc, const char* const* argv,
                                tally_arguments_t* out, char** out_error);

/* ------------------------------------------------------------------------
 * Counting
 * ------------------------------------------------------------------------ */

/* strlen(text); 0 for NULL. */
uint64_t tally_count_bytes(const char* text);

/* length; data may contain NUL bytes. */
uint64_t tally_count_bytes_n(const void* data, size_t length);

/*
 * Number of Unicode scalar values in UTF-8 text. Returns 0 and sets
 * *out_status (if non-NULL) to TALLY_ERROR_INVALID_UTF8 on malformed input.
 */
uint64_t tally_count_characters(const char* text, tally_status_t* out_status);
uint64_t tally_count_characters_n(const void* data, size_t length,
                                  tally_status_t* out_status);

/*
 * tally_measure — count a buffer and digest it; emits one count event
 * labelled `source` (may be NULL).
 */
tally_status_t tally_measure(tally_command_t command, const void* data, size_t length,
                             const char* source, tally_measurement_t* out,
                             char** out_error);

/* tally_measure_file — stream a file through the counter. */
tally_status_t tally_measure_file(tally_command_t command, const char* filename,
                                  tally_measurement_t* out, char** out_error);

/* ------------------------------------------------------------------------
 * Streaming counter (opaque)
 * ------------------------------------------------------------------------ */

typedef struct tally_counter tally_counter_t;

/* NULL for TALLY_COMMAND_VERSION or on allocation failure. */
tally_counter_t* tally_counter_new(tally_command_t command);

/* Feed the next chunk. Multi-byte sequences may straddle chunks. */
tally_status_t tally_counter_feed(tally_counter_t* counter, const void* data, size_t length);

/* Final count. Fails if the input was malformed or ends mid-sequence. */
tally_status_t tally_counter_finish(const tally_counter_t* counter, uint64_t* out_count);

void tally_counter_free(tally_counter_t* counter);

/* ------------------------------------------------------------------------
 * Files
 * ------------------------------------------------------------------------ */

tally_status_t tally_file_read(const char* filename, tally_file_t* out, char** out_error);

/* NUL-terminated copy of the contents. Free with tally_free_string. */
char* tally_file_to_string(const tally_file_t* file);

/* Releases file->data and zeroes the struct. Safe to call twice. */
void tally_file_free(tally_file_t* file);

/* ------------------------------------------------------------------------
 * CSV lists
 * ------------------------------------------------------------------------ */

/* Return non-zero to stop the iteration. `value` is valid for the call only. */
typedef int (*tally_value_callback)(const char* value, void* context);

/*
 * tally_csv_for_each_value — call `callback` with each trimmed, non-empty
 * value of `csv` in order, passing `context` through untouched.
 * Returns TALLY_OK whether the iteration completes or the callback stops it.
 */
tally_status_t tally_csv_for_each_value(const char* csv, tally_value_callback callback,
                                        void* context);

/* Deallocator supplied by the caller for memory the caller allocated. */
typedef void (*tally_release_fn)(char* s);

/*
 * tally_csv_merge_files — concatenate the contents of the files listed in
 * `csv`, in list order.
 *
 * OWNERSHIP: `csv` is consumed. The library calls release_csv(csv) exactly
 * once, on success and on failure, after it has finished reading it. Pass
 * the deallocator matching however `csv` was allocated (tally_free_string
 * for strings returned by this API).
 *
 * Returns the merged contents (NUL-terminated; *out_length excludes the
 * NUL), or NULL on failure with *out_status set. Free with tally_free_string.
 */
char* tally_csv_merge_files(char* csv, tally_release_fn release_csv, size_t* out_length,
                            tally_status_t* out_status, char** out_error);

/*
 * tally_measure_merged — count the concatenation of the files listed in
 * `csv` as one source; emits one count event labelled "<merged>".
 *
 * OWNERSHIP: as tally_csv_merge_files(), `csv` is consumed and
 * release_csv(csv) is called exactly once.
 */
tally_status_t tally_measure_merged(tally_command_t command, char* csv,
                                    tally_release_fn release_csv,
                                    tally_measurement_t* out, char** out_error);

/* ------------------------------------------------------------------------
 * Observability
 * ------------------------------------------------------------------------ */

/* Process counters as JSON. Free with tally_free_string. */
char* tally_stats_json(void);

/* ------------------------------------------------------------------------
 * Memory
 * ------------------------------------------------------------------------ */

/*
 * tally_free_string — free a string returned by this API.
 * Do NOT use free() or delete[] on library strings. NULL is a no-op.
 */
void tally_free_string(char* s);

#ifdef __cplusplus
}  /* extern "C" */
#endif

