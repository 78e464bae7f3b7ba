#pragma once

// tally/args.hpp — Command-line argument validation.
//
// Grammar (argv[0] is the program name):
//   version [--json]
//   (bytes|characters) <file> [--csv-list | --csv-merged] [--json]
//
// Flags may appear in any order after the file. The first failing argument
// is named in Error::detail.

#include <optional>
#include <string_view>
#include <vector>

#include "tally/types.hpp"

namespace tally {

std::optional<Arguments> parse_args(const std::vector<std::string_view>& argv, Error* err);

}  // namespace tally
