#pragma once

// quill/observability.hpp: Structured operation events and process counters.
//
// DESIGN:
//   OperationEvent is the observable unit. Ledger appends, manifest builds,
//   signing and document verification each emit one event, which is:
//     - always folded into the process-wide OperationStats counters,
//     - forwarded to a registered hook if one is set (tests, embedders),
//     - otherwise appended as one JSON line to the configured event log
//       (QUILL_EVENT_LOG or set_event_log_path()).
//
// SANITIZATION:
//   Events carry operation names, error codes, sizes and durations only.
//   Signing keys, signatures and document text are never placed in an event.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace quill {

struct OperationEvent {
  std::string operation;    // "ledger.append", "manifest.build", "sign", "verify"
  bool        ok{false};
  std::string error_code;   // to_string(ErrorCode), empty when ok
  uint64_t    duration_ns{0};
  std::string detail;       // short, non-sensitive context ("id=3", "stage=decoding")
};

class OperationStats {
 public:
  void record(const OperationEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> total_operations{0};
  alignas(64) std::atomic<uint64_t> failed_operations{0};
  alignas(64) std::atomic<uint64_t> ledger_appends{0};
  alignas(64) std::atomic<uint64_t> manifests_built{0};
  alignas(64) std::atomic<uint64_t> signatures_created{0};
  alignas(64) std::atomic<uint64_t> verifications_valid{0};
  alignas(64) std::atomic<uint64_t> verifications_invalid{0};
  alignas(64) std::atomic<uint64_t> total_duration_ns{0};
  alignas(64) std::atomic<uint64_t> sink_failures{0};
};

OperationStats& global_stats();

// Non-blocking for callers: sink failures are counted, never reported.
void emit_operation_event(const OperationEvent& ev);

using OperationEventHook = void (*)(const OperationEvent&);
void set_event_hook(OperationEventHook hook);

// Overrides QUILL_EVENT_LOG. Empty path disables the file sink.
void set_event_log_path(const std::string& path);

// RAII duration capture.
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

}  // namespace quill
