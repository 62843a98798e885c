#include "quill/observability.hpp"

#include "quill/jsonlite.hpp"

#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace quill {

namespace {

std::atomic<OperationEventHook> g_event_hook{nullptr};

std::mutex  g_sink_mu;
std::string g_event_log_path;
bool        g_event_log_path_set{false};

std::string resolve_event_log_path() {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_event_log_path_set) return g_event_log_path;
  const char* env = std::getenv("QUILL_EVENT_LOG");
  return (env && env[0]) ? std::string(env) : std::string();
}

}  // namespace

void OperationStats::record(const OperationEvent& ev) {
  total_operations.fetch_add(1, std::memory_order_relaxed);
  total_duration_ns.fetch_add(ev.duration_ns, std::memory_order_relaxed);
  if (!ev.ok) failed_operations.fetch_add(1, std::memory_order_relaxed);

  if (ev.operation == "ledger.append" && ev.ok) {
    ledger_appends.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "manifest.build" && ev.ok) {
    manifests_built.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "sign" && ev.ok) {
    signatures_created.fetch_add(1, std::memory_order_relaxed);
  } else if (ev.operation == "verify") {
    if (ev.ok) verifications_valid.fetch_add(1, std::memory_order_relaxed);
    else verifications_invalid.fetch_add(1, std::memory_order_relaxed);
  }
}

std::string OperationStats::to_json() const {
  std::string out;
  out.reserve(256);
  out += "{\"total_operations\":";
  out += std::to_string(total_operations.load(std::memory_order_relaxed));
  out += ",\"failed_operations\":";
  out += std::to_string(failed_operations.load(std::memory_order_relaxed));
  out += ",\"ledger_appends\":";
  out += std::to_string(ledger_appends.load(std::memory_order_relaxed));
  out += ",\"manifests_built\":";
  out += std::to_string(manifests_built.load(std::memory_order_relaxed));
  out += ",\"signatures_created\":";
  out += std::to_string(signatures_created.load(std::memory_order_relaxed));
  out += ",\"verifications\":{\"valid\":";
  out += std::to_string(verifications_valid.load(std::memory_order_relaxed));
  out += ",\"invalid\":";
  out += std::to_string(verifications_invalid.load(std::memory_order_relaxed));
  out += "},\"total_duration_ns\":";
  out += std::to_string(total_duration_ns.load(std::memory_order_relaxed));
  out += ",\"sink_failures\":";
  out += std::to_string(sink_failures.load(std::memory_order_relaxed));
  out += "}";
  return out;
}

OperationStats& global_stats() {
  static OperationStats inst;
  return inst;
}

void set_event_hook(OperationEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_event_log_path = path;
  g_event_log_path_set = true;
}

void emit_operation_event(const OperationEvent& ev) {
  global_stats().record(ev);

  OperationEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const std::string log_path = resolve_event_log_path();
  if (log_path.empty()) return;

  std::string line;
  line.reserve(160);
  line += "{\"operation\":\"";
  line += jsonlite::escape(ev.operation);
  line += "\",\"ok\":";
  line += ev.ok ? "true" : "false";
  line += ",\"error_code\":\"";
  line += ev.error_code;
  line += "\",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\"}\n";

  // O_APPEND keeps lines whole for writes below PIPE_BUF.
  std::lock_guard<std::mutex> lk(g_sink_mu);
  FILE* f = std::fopen(log_path.c_str(), "a");
  if (!f) {
    global_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  const bool written = std::fwrite(line.data(), 1, line.size(), f) == line.size();
  if (std::fclose(f) != 0 || !written) {
    global_stats().sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
}

}  // namespace quill
