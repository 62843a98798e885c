#include "quill/manifest.hpp"

#include "quill/observability.hpp"

#include <algorithm>
#include <limits>

namespace quill {

ManifestData manifest_from_totals(const KindTotals& totals) {
  ManifestData m;
  m.total_characters = totals.total();
  if (m.total_characters == 0) return m;

  const double total = static_cast<double>(m.total_characters);
  m.human_percentage = static_cast<double>(totals.human) / total * 100.0;
  m.ai_percentage    = static_cast<double>(totals.ai) / total * 100.0;
  m.cited_percentage = static_cast<double>(totals.cited) / total * 100.0;
  return m;
}

ManifestData build_manifest(const LedgerBackend& ledger, std::size_t excerpt_limit,
                            std::optional<Error>* error) {
  uint64_t duration_ns = 0;
  ManifestData manifest;
  std::optional<Error> err;
  {
    ScopeTimer timer(duration_ns);
    const KindTotals totals = ledger.aggregate(&err);
    if (!err) {
      manifest = manifest_from_totals(totals);
      const auto limit = static_cast<uint32_t>(
          std::min<std::size_t>(excerpt_limit, std::numeric_limits<uint32_t>::max()));
      auto records = ledger.query(std::nullopt, limit, &err);
      if (!err) {
        manifest.events.reserve(records.size());
        for (auto& r : records) manifest.events.push_back(std::move(r.event));
      }
    }
  }

  OperationEvent ev;
  ev.operation   = "manifest.build";
  ev.ok          = !err.has_value();
  ev.error_code  = err ? to_string(err->code) : "";
  ev.duration_ns = duration_ns;
  ev.detail      = "backend=" + ledger.backend_id() +
                   " total_characters=" + std::to_string(manifest.total_characters);
  emit_operation_event(ev);

  if (error) *error = err;
  if (err) return {};
  return manifest;
}

std::string canonical_encode(const ManifestData& manifest) {
  std::string out;
  out.reserve(128);
  out += "{\"ai_percentage\":";
  out += jsonlite::format_double(manifest.ai_percentage);
  out += ",\"cited_percentage\":";
  out += jsonlite::format_double(manifest.cited_percentage);
  out += ",\"human_percentage\":";
  out += jsonlite::format_double(manifest.human_percentage);
  out += ",\"total_characters\":";
  out += std::to_string(manifest.total_characters);
  out += "}";
  return out;
}

jsonlite::Object manifest_to_object(const ManifestData& manifest) {
  jsonlite::Object obj;
  obj["human_percentage"] = jsonlite::Value{manifest.human_percentage};
  obj["ai_percentage"]    = jsonlite::Value{manifest.ai_percentage};
  obj["cited_percentage"] = jsonlite::Value{manifest.cited_percentage};
  obj["total_characters"] = jsonlite::Value{static_cast<std::uint64_t>(manifest.total_characters)};
  jsonlite::Array events;
  events.reserve(manifest.events.size());
  for (const auto& e : manifest.events) events.push_back(jsonlite::Value{event_to_object(e)});
  obj["events"] = jsonlite::Value{std::move(events)};
  return obj;
}

}  // namespace quill
