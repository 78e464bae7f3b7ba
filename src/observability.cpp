#include "tally/observability.hpp"

#include <cstdio>

#include "tally/config.hpp"
#include "tally/jsonlite.hpp"
#include "tally/version.hpp"

namespace tally {

std::string event_to_json(const CountEvent& ev) {
  // MICRO_OPT: pre-reserved string avoids repeated reallocation.
  std::string line;
  line.reserve(256);
  line += "{\"v\":";
  line += std::to_string(version::EVENT_LOG_VERSION);
  line += ",\"command\":\"";
  line += to_string(ev.command);
  line += "\",\"source\":\"";
  line += jsonlite::escape(ev.source);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"count\":";
  line += std::to_string(ev.result);
  line += ",\"bytes_in\":";
  line += std::to_string(ev.bytes_in);
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"digest\":\"";
  line += ev.content_digest;
  line += "\",\"error_code\":\"";
  line += to_string(ev.error_code);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// CountStats
// ---------------------------------------------------------------------------

void CountStats::record(const CountEvent& ev) {
  total_counts.fetch_add(1, std::memory_order_relaxed);
  total_duration_ns.fetch_add(ev.duration_ns, std::memory_order_relaxed);
  if (ev.ok) {
    successful_counts.fetch_add(1, std::memory_order_relaxed);
    bytes_counted.fetch_add(ev.bytes_in, std::memory_order_relaxed);
    if (ev.command == Command::characters) {
      characters_counted.fetch_add(ev.result, std::memory_order_relaxed);
    }
    return;
  }

  failed_counts.fetch_add(1, std::memory_order_relaxed);
  switch (classify(ev.error_code)) {
    case ErrorClass::io:
      io_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    case ErrorClass::decoding:
      decoding_failures.fetch_add(1, std::memory_order_relaxed);
      break;
    default:
      other_failures.fetch_add(1, std::memory_order_relaxed);
      break;
  }
  std::lock_guard<std::mutex> lk(last_error_mu_);
  last_error_ = to_string(ev.error_code);
}

std::string CountStats::last_error() const {
  std::lock_guard<std::mutex> lk(last_error_mu_);
  return last_error_;
}

void CountStats::reset() {
  total_counts.store(0, std::memory_order_relaxed);
  successful_counts.store(0, std::memory_order_relaxed);
  failed_counts.store(0, std::memory_order_relaxed);
  bytes_counted.store(0, std::memory_order_relaxed);
  characters_counted.store(0, std::memory_order_relaxed);
  total_duration_ns.store(0, std::memory_order_relaxed);
  io_failures.store(0, std::memory_order_relaxed);
  decoding_failures.store(0, std::memory_order_relaxed);
  other_failures.store(0, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lk(last_error_mu_);
  last_error_.clear();
}

std::string CountStats::to_json() const {
  std::string out;
  out.reserve(512);
  out += "{\"total_counts\":";
  out += std::to_string(total_counts.load(std::memory_order_relaxed));
  out += ",\"successful_counts\":";
  out += std::to_string(successful_counts.load(std::memory_order_relaxed));
  out += ",\"failed_counts\":";
  out += std::to_string(failed_counts.load(std::memory_order_relaxed));
  out += ",\"bytes_counted\":";
  out += std::to_string(bytes_counted.load(std::memory_order_relaxed));
  out += ",\"characters_counted\":";
  out += std::to_string(characters_counted.load(std::memory_order_relaxed));
  out += ",\"total_duration_ns\":";
  out += std::to_string(total_duration_ns.load(std::memory_order_relaxed));
  out += ",\"failures\":{\"io\":";
  out += std::to_string(io_failures.load(std::memory_order_relaxed));
  out += ",\"decoding\":";
  out += std::to_string(decoding_failures.load(std::memory_order_relaxed));
  out += ",\"other\":";
  out += std::to_string(other_failures.load(std::memory_order_relaxed));
  out += "},\"last_error\":\"";
  out += last_error();
  out += "\"}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

CountStats& global_count_stats() {
  static CountStats inst;
  return inst;
}

namespace {
std::atomic<CountEventHook> g_event_hook{nullptr};
}

void set_count_event_hook(CountEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_count_event(const CountEvent& ev) {
  global_count_stats().record(ev);

  CountEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string log_path = global_config().event_log_path;
  if (log_path.empty()) return;

  const std::string line = event_to_json(ev) + "\n";
  // O_APPEND semantics: one fwrite per line keeps lines whole.
  if (FILE* f = std::fopen(log_path.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace tally
