// tally command-line front end.
//
// The CLI is a host of the C ABI: every library call below goes through
// tally/c_api.h, exactly as a C or Rust host would make it. Library-owned
// strings are held in LibString so they always go back through
// tally_free_string().
//
// Exit codes: 0 ok, 1 usage error, 2 I/O error, 3 decoding error,
// 4 internal or ABI error.

#include <iostream>
#include <memory>
#include <string>

#include "tally/c_api.h"
#include "tally/jsonlite.hpp"

namespace {

using LibString = std::unique_ptr<char, void (*)(char*)>;

LibString adopt(char* s) {
  return LibString(s, tally_free_string);
}

constexpr const char* kUsage =
    "usage:\n"
    "  tally version [--json]\n"
    "  tally bytes [--] <file> [--csv-list | --csv-merged] [--json]\n"
    "  tally characters [--] <file> [--csv-list | --csv-merged] [--json]\n";

int exit_code_for(tally_status_t status) {
  const int v = static_cast<int>(status);
  if (v == 0) return 0;
  if (v >= 10 && v < 20) return 1;
  if (v >= 20 && v < 30) return 2;
  if (v >= 30 && v < 40) return 3;
  return 4;
}

// One JSON object per line on stderr. Takes ownership of detail.
void print_error(tally_status_t status, char* detail) {
  LibString owned = adopt(detail);
  std::cerr << "{\"error\":\"" << tally_status_name(status) << "\",\"detail\":\""
            << tally::jsonlite::escape(owned ? owned.get() : "") << "\"}\n";
}

struct CommandContext {
  tally_command_t command{TALLY_COMMAND_BYTES};
  bool json{false};
  bool print_filename{false};
  tally_status_t status{TALLY_OK};
};

const char* command_name(tally_command_t command) {
  return command == TALLY_COMMAND_CHARACTERS ? "characters" : "bytes";
}

void print_result(const CommandContext& ctx, const tally_measurement_t& m, const char* filename) {
  if (ctx.json) {
    std::cout << "{\"command\":\"" << command_name(ctx.command) << "\"";
    if (filename) std::cout << ",\"file\":\"" << tally::jsonlite::escape(filename) << "\"";
    std::cout << ",\"count\":" << m.count << ",\"bytes\":" << m.bytes
              << ",\"digest\":\"" << m.digest << "\"}\n";
    return;
  }
  if (filename && ctx.print_filename) {
    std::cout << m.count << " " << filename << "\n";
  } else {
    std::cout << m.count << "\n";
  }
}

// Plain output names the file only in --csv-list mode; JSON output always does.
// Also the tally_value_callback for --csv-list. Non-zero stops the list.
int run_command_for_file(const char* filename, void* ctx_ptr) {
  auto* ctx = static_cast<CommandContext*>(ctx_ptr);
  tally_measurement_t m{};
  char* err = nullptr;
  const tally_status_t status = tally_measure_file(ctx->command, filename, &m, &err);
  if (status != TALLY_OK) {
    print_error(status, err);
    ctx->status = status;
    return 1;
  }
  print_result(*ctx, m, filename);
  return 0;
}

// Reads the CSV list file through the library. Null on failure (reported).
LibString load_csv(const char* path, tally_status_t* status) {
  tally_file_t file{};
  char* err = nullptr;
  *status = tally_file_read(path, &file, &err);
  if (*status != TALLY_OK) {
    print_error(*status, err);
    return adopt(nullptr);
  }
  LibString csv = adopt(tally_file_to_string(&file));
  tally_file_free(&file);
  if (!csv) {
    *status = TALLY_ERROR_OUT_OF_MEMORY;
    print_error(*status, nullptr);
  }
  return csv;
}

int run_version(bool json) {
  if (!json) {
    tally_print_version();
    return 0;
  }
  LibString manifest = adopt(tally_version_manifest_json());
  if (!manifest) {
    print_error(TALLY_ERROR_OUT_OF_MEMORY, nullptr);
    return exit_code_for(TALLY_ERROR_OUT_OF_MEMORY);
  }
  std::cout << manifest.get() << "\n";
  return 0;
}

int run_csv_list(CommandContext& ctx, const char* path) {
  tally_status_t status = TALLY_OK;
  LibString csv = load_csv(path, &status);
  if (!csv) return exit_code_for(status);

  ctx.print_filename = true;
  status = tally_csv_for_each_value(csv.get(), run_command_for_file, &ctx);
  if (status != TALLY_OK) {
    print_error(status, nullptr);
    return exit_code_for(status);
  }
  return exit_code_for(ctx.status);
}

int run_csv_merged(const CommandContext& ctx, const char* path) {
  tally_status_t status = TALLY_OK;
  LibString csv = load_csv(path, &status);
  if (!csv) return exit_code_for(status);

  // The CSV text is handed over together with the function that frees it.
  tally_measurement_t m{};
  char* err = nullptr;
  status = tally_measure_merged(ctx.command, csv.release(), tally_free_string, &m, &err);
  if (status != TALLY_OK) {
    print_error(status, err);
    return exit_code_for(status);
  }
  print_result(ctx, m, nullptr);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (tally_check_abi(TALLY_ABI_VERSION) != TALLY_OK) {
    std::cerr << "{\"error\":\"abi_version_mismatch\",\"detail\":\"library ABI "
              << tally_abi_version() << " != " << TALLY_ABI_VERSION << "\"}\n";
    return exit_code_for(TALLY_ERROR_ABI_MISMATCH);
  }

  tally_arguments_t args{};
  char* err = nullptr;
  const tally_status_t status =
      tally_parse_args(static_cast<size_t>(argc), argv, &args, &err);
  if (status != TALLY_OK) {
    print_error(status, err);
    std::cerr << kUsage;
    return exit_code_for(status);
  }

  if (args.command == TALLY_COMMAND_VERSION) {
    return run_version(args.json != 0);
  }

  CommandContext ctx;
  ctx.command = args.command;
  ctx.json = args.json != 0;

  switch (args.file_mode) {
    case TALLY_FILE_MODE_NORMAL:
      run_command_for_file(args.filename, &ctx);
      return exit_code_for(ctx.status);
    case TALLY_FILE_MODE_CSV_LIST:
      return run_csv_list(ctx, args.filename);
    case TALLY_FILE_MODE_CSV_MERGED:
      return run_csv_merged(ctx, args.filename);
  }
  print_error(TALLY_ERROR_INTERNAL, nullptr);
  return exit_code_for(TALLY_ERROR_INTERNAL);
}
