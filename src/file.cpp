#include "tally/file.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

#if defined(TALLY_WITH_ZSTD)
#include <zstd.h>
#endif

#include "tally/config.hpp"

namespace fs = std::filesystem;

namespace tally {
namespace {

#if defined(TALLY_WITH_ZSTD)
constexpr unsigned char kZstdMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};

bool has_zstd_magic(std::string_view chunk) {
  if (chunk.size() < sizeof(kZstdMagic)) return false;
  for (std::size_t i = 0; i < sizeof(kZstdMagic); ++i) {
    if (static_cast<unsigned char>(chunk[i]) != kZstdMagic[i]) return false;
  }
  return true;
}

struct DCtxDeleter {
  void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); }
};

// Streaming zstd decoder. Decoded output is forwarded to the sink in
// blocks of at most ZSTD_DStreamOutSize() bytes.
class ZstdDecoder {
 public:
  ZstdDecoder() : dctx_(ZSTD_createDCtx()), out_(ZSTD_DStreamOutSize()) {}

  // Returns false on a corrupt frame (err set) or when the sink stops.
  bool decode(std::string_view input, const ChunkFn& sink, bool* stopped, Error* err) {
    if (!dctx_) {
      fail(err, ErrorCode::out_of_memory, "ZSTD_createDCtx failed");
      return false;
    }
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    while (in.pos < in.size) {
      ZSTD_outBuffer out{out_.data(), out_.size(), 0};
      const size_t ret = ZSTD_decompressStream(dctx_.get(), &out, &in);
      if (ZSTD_isError(ret)) {
        fail(err, ErrorCode::decompression_failed, ZSTD_getErrorName(ret));
        return false;
      }
      last_ret_ = ret;
      if (out.pos > 0 && !sink(std::string_view(out_.data(), out.pos))) {
        *stopped = true;
        return false;
      }
    }
    return true;
  }

  // A non-zero hint after the last input means the frame was cut short.
  bool complete() const { return last_ret_ == 0; }

 private:
  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx_;
  std::vector<char> out_;
  size_t last_ret_{0};
};
#endif

}  // namespace

bool for_each_chunk(const std::string& path, uint64_t max_bytes, bool decompress,
                    const ChunkFn& fn, Error* err) {
  std::error_code ec;
  const auto status = fs::status(path, ec);
  // ENOENT and ENOTDIR mean nothing is there; EACCES, ELOOP and the rest mean
  // something is there that cannot be reached.
  if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
    fail(err, ErrorCode::file_unreadable, "Could not open file: '" + path + "': " + ec.message());
    return false;
  }
  if (!fs::exists(status)) {
    fail(err, ErrorCode::file_not_found, "Could not open file: '" + path + "'");
    return false;
  }
  if (fs::is_directory(status)) {
    fail(err, ErrorCode::file_unreadable, "'" + path + "' is a directory");
    return false;
  }

#if !defined(TALLY_WITH_ZSTD)
  (void)decompress;
#endif

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    fail(err, ErrorCode::file_unreadable, "Could not open file: '" + path + "'");
    return false;
  }

  uint64_t produced = 0;
  bool too_large = false;
  const ChunkFn capped = [&](std::string_view chunk) {
    produced += chunk.size();
    if (produced > max_bytes) {
      too_large = true;
      return false;
    }
    return fn(chunk);
  };
  auto report_too_large = [&]() {
    fail(err, ErrorCode::file_too_large,
         "'" + path + "' exceeds the " + std::to_string(max_bytes) + " byte limit");
    return false;
  };

  std::vector<char> buffer(kReadChunkSize);
  bool first = true;
#if defined(TALLY_WITH_ZSTD)
  std::unique_ptr<ZstdDecoder> decoder;
#endif

  while (file.good()) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = file.gcount();
    if (count <= 0) break;
    const std::string_view chunk(buffer.data(), static_cast<std::size_t>(count));

#if defined(TALLY_WITH_ZSTD)
    if (first && decompress && has_zstd_magic(chunk)) decoder = std::make_unique<ZstdDecoder>();
    if (decoder) {
      bool stopped = false;
      if (!decoder->decode(chunk, capped, &stopped, err)) {
        if (too_large) return report_too_large();
        return stopped;
      }
      first = false;
      continue;
    }
#endif
    first = false;

    if (!capped(chunk)) {
      if (too_large) return report_too_large();
      return true;
    }
  }

  if (file.bad()) {
    fail(err, ErrorCode::file_unreadable, "I/O error while reading '" + path + "'");
    return false;
  }
#if defined(TALLY_WITH_ZSTD)
  if (decoder && !decoder->complete()) {
    fail(err, ErrorCode::decompression_failed, "'" + path + "' ends inside a zstd frame");
    return false;
  }
#endif
  return true;
}

std::optional<FileContents> read_file(const std::string& path, Error* err) {
  FileContents out;
  out.filename = path;
  const Config cfg = global_config();
  const bool ok = for_each_chunk(path, cfg.max_file_bytes, cfg.decompress,
                                 [&](std::string_view chunk) {
                                   out.data.append(chunk.data(), chunk.size());
                                   return true;
                                 },
                                 err);
  if (!ok) return std::nullopt;
  return out;
}

}  // namespace tally
