#pragma once

// tally/observability.hpp — Count events, process statistics and the event log.
//
// DESIGN:
//   CountEvent is the observable unit. Every measurement (one file in
//   normal/csv-list mode, the concatenation in csv-merged mode) emits exactly
//   one CountEvent, successful or not. emit_count_event():
//     1. records it in the process-global CountStats (always),
//     2. hands it to the installed hook, if any, and stops there,
//     3. otherwise appends one JSON line to the configured event log
//        (Config::event_log_path / TALLY_EVENT_LOG), if any.
//
// Event log format (EVENT_LOG_VERSION = 1), one object per line:
//   {"v":1,"command":"characters","source":"a.txt","ok":true,"count":5,
//    "bytes_in":6,"duration_ns":1234,"digest":"...","error_code":""}

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "tally/types.hpp"

namespace tally {

struct CountEvent {
  Command command{Command::bytes};
  std::string source;          // file path; "<merged>" or "<memory>" otherwise
  uint64_t bytes_in{0};
  uint64_t result{0};
  uint64_t duration_ns{0};
  std::string content_digest;  // empty when digests are disabled or on failure
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
};

std::string event_to_json(const CountEvent& ev);

// ---------------------------------------------------------------------------
// CountStats — process-global aggregated statistics
// ---------------------------------------------------------------------------
// All counters are atomic. last_error is guarded by a mutex.
class CountStats {
 public:
  void record(const CountEvent& ev);
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> total_counts{0};
  std::atomic<uint64_t> successful_counts{0};
  std::atomic<uint64_t> failed_counts{0};
  std::atomic<uint64_t> bytes_counted{0};
  std::atomic<uint64_t> characters_counted{0};
  std::atomic<uint64_t> total_duration_ns{0};

  // Failures by class. Usage errors never reach the counters.
  std::atomic<uint64_t> io_failures{0};
  std::atomic<uint64_t> decoding_failures{0};
  std::atomic<uint64_t> other_failures{0};

  std::string last_error() const;

 private:
  mutable std::mutex last_error_mu_;
  std::string last_error_;
};

CountStats& global_count_stats();

void emit_count_event(const CountEvent& ev);

using CountEventHook = void (*)(const CountEvent&);
void set_count_event_hook(CountEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace tally
