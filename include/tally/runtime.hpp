#pragma once

// tally/runtime.hpp — Measurement entry points.
//
// Every call emits exactly one CountEvent (see observability.hpp), on
// success and on failure. Digests are computed over the same bytes that
// are counted, in the same pass, when Config::digest is enabled.

#include <optional>
#include <string>
#include <string_view>

#include "tally/types.hpp"

namespace tally {

// Counts an in-memory buffer. source labels the event ("<memory>" if empty).
std::optional<Measurement> measure_text(Command command, std::string_view data,
                                        std::string_view source, Error* err);

// Streams a file through the counter; the file is never held in memory whole.
std::optional<Measurement> measure_file(Command command, const std::string& path, Error* err);

// Concatenates the files listed in csv, in order, and counts the result.
std::optional<Measurement> measure_merged(Command command, std::string_view csv, Error* err);

}  // namespace tally
