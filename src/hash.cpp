#include "tally/hash.hpp"

// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for nibble
// encoding instead of snprintf("%02x") per byte.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace tally {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

struct Blake3Stream::State {
  blake3_hasher hasher;
};

Blake3Stream::Blake3Stream() : state_(std::make_unique<State>()) {
  blake3_hasher_init(&state_->hasher);
}

Blake3Stream::~Blake3Stream() = default;

void Blake3Stream::update(std::string_view chunk) {
  blake3_hasher_update(&state_->hasher, chunk.data(), chunk.size());
}

std::string Blake3Stream::finalize_hex() const {
  // blake3_hasher_finalize does not modify the hasher; more input may follow.
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&state_->hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

}  // namespace tally
