#pragma once

// tally/counting.hpp — Byte and character counting.
//
// DEFINITIONS:
//   bytes      — number of raw bytes in the input.
//   characters — number of Unicode scalar values in the input, which must be
//                well-formed UTF-8 (RFC 3629): no overlong forms, no
//                surrogates, nothing above U+10FFFF, no stray continuation
//                bytes, no truncated sequences.
//
// INVARIANTS:
//   - characters(T) <= bytes(T) for every valid T; equal iff T is ASCII.
//   - Counter produces the same result however the input is chunked.
//     A multi-byte sequence split across two feed() calls is carried over.

#include <cstdint>
#include <optional>
#include <string_view>

#include "tally/types.hpp"

namespace tally {

uint64_t count_bytes(std::string_view data);

// Returns std::nullopt and sets *err (invalid_utf8) on malformed input.
std::optional<uint64_t> count_characters(std::string_view data, Error* err);

// ---------------------------------------------------------------------------
// Counter — streaming counter
// ---------------------------------------------------------------------------
// Exposed across the C ABI as the opaque tally_counter_t.
//
// Usage:
//   Counter c(Command::characters);
//   while (read chunk) if (!c.feed(chunk)) break;
//   auto n = c.finish(&err);
//
// After a decoding error the counter is poisoned: further feed() calls are
// ignored and finish() reports the first error.
class Counter {
 public:
  explicit Counter(Command command);

  // Returns false once the input is known to be malformed.
  bool feed(std::string_view chunk);

  // Returns the count, or std::nullopt with *err set when the input was
  // malformed or ends inside a multi-byte sequence.
  std::optional<uint64_t> finish(Error* err) const;

  Command command() const { return command_; }
  uint64_t bytes_seen() const { return bytes_; }

 private:
  void poison(uint64_t offset, const char* what);

  Command command_;
  uint64_t bytes_{0};
  uint64_t chars_{0};

  // UTF-8 decoder state: continuation bytes still expected, the accepted
  // range for the next one, and where the current sequence started.
  uint8_t need_{0};
  uint8_t lo_{0x80};
  uint8_t hi_{0xBF};
  uint64_t seq_start_{0};

  std::optional<Error> error_;
};

}  // namespace tally
