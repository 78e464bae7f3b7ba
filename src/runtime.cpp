#include "tally/runtime.hpp"

#include <memory>

#include "tally/config.hpp"
#include "tally/counting.hpp"
#include "tally/csv.hpp"
#include "tally/file.hpp"
#include "tally/hash.hpp"
#include "tally/observability.hpp"

namespace tally {
namespace {

constexpr std::string_view kMemorySource = "<memory>";
constexpr std::string_view kMergedSource = "<merged>";

// Feeds the counter and, when enabled, the hasher from the same chunks.
class MeasureSink {
 public:
  MeasureSink(Command command, bool digest)
      : counter_(command), hasher_(digest ? std::make_unique<Blake3Stream>() : nullptr) {}

  bool feed(std::string_view chunk) {
    if (hasher_) hasher_->update(chunk);
    return counter_.feed(chunk);
  }

  std::optional<Measurement> finish(Error* err) const {
    auto n = counter_.finish(err);
    if (!n) return std::nullopt;
    Measurement m;
    m.command = counter_.command();
    m.count = *n;
    m.bytes = counter_.bytes_seen();
    if (hasher_) m.digest = hasher_->finalize_hex();
    return m;
  }

  uint64_t bytes_seen() const { return counter_.bytes_seen(); }

 private:
  Counter counter_;
  std::unique_ptr<Blake3Stream> hasher_;
};

std::optional<Measurement> finish_and_emit(CountEvent& ev, std::optional<Measurement> m,
                                           const Error& local, Error* err) {
  if (m) {
    ev.ok = true;
    ev.result = m->count;
    ev.bytes_in = m->bytes;
    ev.content_digest = m->digest;
  } else {
    ev.ok = false;
    ev.error_code = local.code;
    if (err) *err = local;
  }
  emit_count_event(ev);
  return m;
}

bool check_command(Command command, Error* err) {
  if (command == Command::bytes || command == Command::characters) return true;
  fail(err, ErrorCode::invalid_argument,
       "command '" + to_string(command) + "' does not count anything");
  return false;
}

}  // namespace

std::optional<Measurement> measure_text(Command command, std::string_view data,
                                        std::string_view source, Error* err) {
  if (!check_command(command, err)) return std::nullopt;

  CountEvent ev;
  ev.command = command;
  ev.source = std::string(source.empty() ? kMemorySource : source);

  Error local;
  std::optional<Measurement> m;
  {
    ScopeTimer t(ev.duration_ns);
    MeasureSink sink(command, global_config().digest);
    sink.feed(data);
    m = sink.finish(&local);
  }
  ev.bytes_in = data.size();
  return finish_and_emit(ev, std::move(m), local, err);
}

std::optional<Measurement> measure_file(Command command, const std::string& path, Error* err) {
  if (!check_command(command, err)) return std::nullopt;

  const Config cfg = global_config();
  CountEvent ev;
  ev.command = command;
  ev.source = path;

  Error local;
  std::optional<Measurement> m;
  {
    ScopeTimer t(ev.duration_ns);
    MeasureSink sink(command, cfg.digest);
    const bool read_ok = for_each_chunk(
        path, cfg.max_file_bytes, cfg.decompress,
        [&](std::string_view chunk) { return sink.feed(chunk); }, &local);
    // A decoding error stops the read early; finish() reports it.
    if (read_ok) m = sink.finish(&local);
    ev.bytes_in = sink.bytes_seen();
  }
  return finish_and_emit(ev, std::move(m), local, err);
}

std::optional<Measurement> measure_merged(Command command, std::string_view csv, Error* err) {
  if (!check_command(command, err)) return std::nullopt;

  Error local;
  auto merged = merge_files(csv, &local);
  if (!merged) {
    CountEvent ev;
    ev.command = command;
    ev.source = std::string(kMergedSource);
    return finish_and_emit(ev, std::nullopt, local, err);
  }
  return measure_text(command, *merged, kMergedSource, err);
}

}  // namespace tally
