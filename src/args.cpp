#include "tally/args.hpp"

#include <string>

namespace tally {

std::optional<Arguments> parse_args(const std::vector<std::string_view>& argv, Error* err) {
  if (argv.size() < 2) {
    return fail(err, ErrorCode::usage_missing_command, "Missing command.");
  }

  Arguments args;
  const auto command = parse_command(argv[1]);
  if (!command) {
    return fail(err, ErrorCode::usage_unknown_command,
                "Command not recognized: " + std::string(argv[1]));
  }
  args.command = *command;

  std::size_t next = 2;
  if (args.command != Command::version) {
    // "--" ends option parsing for the file operand, so "--x.txt" can be named.
    std::size_t file_at = 2;
    const bool end_of_options = argv.size() > 2 && argv[2] == "--";
    if (end_of_options) file_at = 3;
    // Otherwise a flag in the file position means the file was left out.
    if (argv.size() <= file_at || (!end_of_options && argv[file_at].rfind("--", 0) == 0)) {
      return fail(err, ErrorCode::usage_missing_filename,
                  "Missing filename for '" + to_string(args.command) + "'.");
    }
    args.filename = std::string(argv[file_at]);
    args.filename_index = file_at;
    next = file_at + 1;
  }

  bool csv_flag_seen = false;
  for (std::size_t i = next; i < argv.size(); ++i) {
    const std::string_view flag = argv[i];
    if (flag == "--json") {
      args.json = true;
      continue;
    }
    const bool csv_list = flag == "--csv-list";
    const bool csv_merged = flag == "--csv-merged";
    if ((csv_list || csv_merged) && args.command != Command::version) {
      if (csv_flag_seen) {
        return fail(err, ErrorCode::usage_conflicting_flags,
                    "Only one of --csv-list and --csv-merged may be given.");
      }
      csv_flag_seen = true;
      args.file_mode = csv_list ? FileMode::csv_list : FileMode::csv_merged;
      continue;
    }
    return fail(err, ErrorCode::usage_unknown_flag,
                "Flag not recognized: " + std::string(flag));
  }
  return args;
}

}  // namespace tally
