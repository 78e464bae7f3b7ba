#include "tally/counting.hpp"

#include <string>

namespace tally {

uint64_t count_bytes(std::string_view data) {
  return static_cast<uint64_t>(data.size());
}

std::optional<uint64_t> count_characters(std::string_view data, Error* err) {
  Counter c(Command::characters);
  c.feed(data);
  return c.finish(err);
}

Counter::Counter(Command command) : command_(command) {}

void Counter::poison(uint64_t offset, const char* what) {
  if (error_) return;
  error_ = Error{ErrorCode::invalid_utf8,
                 std::string(what) + " at byte offset " + std::to_string(offset)};
}

bool Counter::feed(std::string_view chunk) {
  if (error_) return false;

  const uint64_t base = bytes_;
  bytes_ += chunk.size();
  if (command_ != Command::characters) return true;

  const auto* p = reinterpret_cast<const unsigned char*>(chunk.data());
  for (std::size_t i = 0; i < chunk.size(); ++i) {
    const unsigned char b = p[i];

    if (need_ > 0) {
      if (b < lo_ || b > hi_) {
        poison(seq_start_, "malformed multi-byte sequence");
        return false;
      }
      lo_ = 0x80;
      hi_ = 0xBF;
      if (--need_ == 0) ++chars_;
      continue;
    }

    // Lead byte. The first continuation range is narrowed for E0/ED/F0/F4
    // to exclude overlong forms, surrogates and values above U+10FFFF.
    seq_start_ = base + i;
    if (b < 0x80) {
      ++chars_;
    } else if (b >= 0xC2 && b <= 0xDF) {
      need_ = 1;
    } else if (b == 0xE0) {
      need_ = 2;
      lo_ = 0xA0;
    } else if (b == 0xED) {
      need_ = 2;
      hi_ = 0x9F;
    } else if (b >= 0xE1 && b <= 0xEF) {
      need_ = 2;
    } else if (b == 0xF0) {
      need_ = 3;
      lo_ = 0x90;
    } else if (b >= 0xF1 && b <= 0xF3) {
      need_ = 3;
    } else if (b == 0xF4) {
      need_ = 3;
      hi_ = 0x8F;
    } else {
      poison(seq_start_, "invalid UTF-8 lead byte");
      return false;
    }
  }
  return true;
}

std::optional<uint64_t> Counter::finish(Error* err) const {
  if (error_) return fail(err, error_->code, error_->detail);

  switch (command_) {
    case Command::bytes:
      return bytes_;
    case Command::characters:
      if (need_ > 0) {
        return fail(err, ErrorCode::invalid_utf8,
                    "truncated multi-byte sequence at byte offset " +
                        std::to_string(seq_start_));
      }
      return chars_;
    case Command::version:
      break;
  }
  return fail(err, ErrorCode::invalid_argument, "counter created for 'version'");
}

}  // namespace tally
