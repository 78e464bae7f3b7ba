#pragma once

// tally/hash.hpp — BLAKE3 content digests.
//
// A digest identifies exactly the bytes that were counted, so a reported
// count can be tied back to its input. BLAKE3 is the sole primitive.

#include <memory>
#include <string>
#include <string_view>

namespace tally {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// 64-char lowercase hex digest of payload.
std::string blake3_hex(std::string_view payload);

// Incremental hasher. Feeding the same bytes in any chunking yields the
// same digest as blake3_hex() over their concatenation.
class Blake3Stream {
 public:
  Blake3Stream();
  ~Blake3Stream();
  Blake3Stream(const Blake3Stream&) = delete;
  Blake3Stream& operator=(const Blake3Stream&) = delete;

  void update(std::string_view chunk);
  std::string finalize_hex() const;

 private:
  struct State;
  std::unique_ptr<State> state_;
};

}  // namespace tally
