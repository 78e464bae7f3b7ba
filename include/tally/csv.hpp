#pragma once

// tally/csv.hpp — CSV lists of file paths.
//
// FORMAT: a single record of comma-separated paths. Each value is trimmed of
// surrounding whitespace (space, tab, CR, LF). Values that trim to empty are
// skipped, so "a.txt, b.txt,\n" names two files. There is no quoting.

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tally/types.hpp"

namespace tally {

std::vector<std::string> split_values(std::string_view csv);

// Calls fn for each value in list order. Return false from fn to stop.
// Returns the number of values visited.
std::size_t for_each_value(std::string_view csv, const std::function<bool(const std::string&)>& fn);

// Concatenation of the listed files' contents in list order. The whole
// result is capped at global_config().max_file_bytes like a single file.
// Stops on the first file that cannot be read.
std::optional<std::string> merge_files(std::string_view csv, Error* err);

}  // namespace tally
