#include "quill/ledger.hpp"

#include "quill/observability.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>

#include <sys/stat.h>
#include <unistd.h>

namespace quill {

namespace {

std::optional<Error> check_event(const ProvenanceEvent& event) {
  const auto problems = validate_event(event);
  if (problems.empty()) return std::nullopt;
  std::string message = "invalid provenance event: ";
  for (size_t i = 0; i < problems.size(); ++i) {
    if (i) message += "; ";
    message += problems[i];
  }
  return Error{ErrorCode::invalid_input, message};
}

void emit_append(bool ok, const std::optional<Error>& err, uint64_t id, uint64_t duration_ns) {
  OperationEvent ev;
  ev.operation   = "ledger.append";
  ev.ok          = ok;
  ev.error_code  = err ? to_string(err->code) : "";
  ev.duration_ns = duration_ns;
  ev.detail      = ok ? "id=" + std::to_string(id) : (err ? err->message : "");
  emit_operation_event(ev);
}

void emit_storage_event(const char* operation, bool ok, const std::string& detail) {
  OperationEvent ev;
  ev.operation  = operation;
  ev.ok         = ok;
  ev.error_code = ok ? "" : to_string(ErrorCode::storage_failure);
  ev.detail     = detail;
  emit_operation_event(ev);
}

// Newest first: timestamp descending, then id descending. The id tiebreak makes
// the order total, so the result is the same as a stable sort over insertion
// order reversed.
std::vector<LedgerRecord> select_records(const std::vector<LedgerRecord>& records,
                                         std::optional<ProvenanceKind> kind,
                                         std::optional<uint32_t> limit) {
  std::vector<LedgerRecord> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    if (!kind || r.event.kind == *kind) out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const LedgerRecord& a, const LedgerRecord& b) {
    if (a.event.timestamp != b.event.timestamp) return a.event.timestamp > b.event.timestamp;
    return a.id > b.id;
  });
  if (limit && out.size() > *limit) out.resize(*limit);
  return out;
}

KindTotals sum_spans(const std::vector<LedgerRecord>& records) {
  KindTotals t;
  for (const auto& r : records) {
    switch (r.event.kind) {
      case ProvenanceKind::human: t.human += r.event.span_length; break;
      case ProvenanceKind::ai: t.ai += r.event.span_length; break;
      case ProvenanceKind::cited: t.cited += r.event.span_length; break;
    }
  }
  return t;
}

KindCounts count_kinds(const std::vector<LedgerRecord>& records) {
  KindCounts c;
  for (const auto& r : records) {
    switch (r.event.kind) {
      case ProvenanceKind::human: ++c.human; break;
      case ProvenanceKind::ai: ++c.ai; break;
      case ProvenanceKind::cited: ++c.cited; break;
    }
  }
  return c;
}

std::string record_line(const LedgerRecord& r) {
  auto obj = event_to_object(r.event);
  obj["id"] = jsonlite::Value{static_cast<std::uint64_t>(r.id)};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)}) + "\n";
}

Error storage_error(const std::string& message) {
  return Error{ErrorCode::storage_failure, message};
}

}  // namespace

// ---------------------------------------------------------------------------
// Event codec
// ---------------------------------------------------------------------------

jsonlite::Object event_to_object(const ProvenanceEvent& event) {
  jsonlite::Object obj;
  obj["timestamp"]      = jsonlite::Value{event.timestamp};
  obj["kind"]           = jsonlite::Value{to_string(event.kind)};
  obj["content_digest"] = jsonlite::Value{event.content_digest};
  obj["source"]         = jsonlite::Value{event.source};
  obj["span_length"]    = jsonlite::Value{static_cast<std::uint64_t>(event.span_length)};
  return obj;
}

ProvenanceEvent event_from_object(const jsonlite::Object& obj, std::optional<Error>* error) {
  ProvenanceEvent ev;
  for (const char* key : {"timestamp", "kind", "content_digest", "source"}) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second.is_string()) {
      if (error) *error = Error{ErrorCode::invalid_input, std::string("event field missing or not a string: ") + key};
      return {};
    }
  }
  auto span = obj.find("span_length");
  if (span == obj.end() || !span->second.is_u64()) {
    if (error) *error = Error{ErrorCode::invalid_input, "event field span_length must be a non-negative integer"};
    return {};
  }
  const std::string kind_name = jsonlite::get_string(obj, "kind");
  const auto kind = parse_kind(kind_name);
  if (!kind) {
    if (error) *error = Error{ErrorCode::invalid_input, "unknown event kind: " + kind_name};
    return {};
  }
  ev.timestamp      = jsonlite::get_string(obj, "timestamp");
  ev.kind           = *kind;
  ev.content_digest = jsonlite::get_string(obj, "content_digest");
  ev.source         = jsonlite::get_string(obj, "source");
  ev.span_length    = jsonlite::get_u64(obj, "span_length");
  if (error) error->reset();
  return ev;
}

// ---------------------------------------------------------------------------
// MemoryLedger
// ---------------------------------------------------------------------------

uint64_t MemoryLedger::append(const ProvenanceEvent& event, std::optional<Error>* error) {
  uint64_t duration_ns = 0;
  uint64_t id = 0;
  std::optional<Error> err;
  {
    ScopeTimer timer(duration_ns);
    err = check_event(event);
    if (!err) {
      std::unique_lock<std::shared_mutex> lk(mu_);
      id = next_id_++;
      records_.push_back(LedgerRecord{id, event});
    }
  }
  emit_append(!err, err, id, duration_ns);
  if (error) *error = err;
  return id;
}

std::vector<LedgerRecord> MemoryLedger::query(std::optional<ProvenanceKind> kind,
                                              std::optional<uint32_t> limit,
                                              std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return select_records(records_, kind, limit);
}

KindTotals MemoryLedger::aggregate(std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return sum_spans(records_);
}

KindCounts MemoryLedger::count_by_kind(std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return count_kinds(records_);
}

std::optional<Error> MemoryLedger::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  records_.clear();
  next_id_ = 1;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// FileLedger
// ---------------------------------------------------------------------------

std::unique_ptr<FileLedger> FileLedger::open(const std::string& path,
                                             std::optional<Error>* error) {
  std::unique_ptr<FileLedger> ledger(new FileLedger(path));

  std::error_code ec;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) *error = storage_error("cannot create ledger directory: " + ec.message());
      return nullptr;
    }
  }

  if (std::filesystem::exists(path, ec)) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      if (error) *error = storage_error("cannot read ledger file: " + path);
      return nullptr;
    }
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
      ++line_no;
      if (line.empty()) continue;
      std::optional<jsonlite::JsonError> jerr;
      auto obj = jsonlite::parse(line, &jerr);
      std::optional<Error> eerr;
      ProvenanceEvent ev;
      if (!jerr) ev = event_from_object(obj, &eerr);
      const uint64_t id = jsonlite::get_u64(obj, "id", 0);
      if (jerr || eerr || id == 0 || id < ledger->next_id_) {
        if (error) *error = storage_error("corrupt ledger record at line " + std::to_string(line_no));
        return nullptr;
      }
      ledger->records_.push_back(LedgerRecord{id, std::move(ev)});
      ledger->next_id_ = id + 1;
    }
  }

  ledger->file_ = std::fopen(path.c_str(), "a");
  if (!ledger->file_) {
    if (error) *error = storage_error("cannot open ledger file for append: " + path);
    return nullptr;
  }
  if (error) error->reset();
  return ledger;
}

FileLedger::~FileLedger() {
  if (file_) std::fclose(file_);
}

uint64_t FileLedger::append(const ProvenanceEvent& event, std::optional<Error>* error) {
  uint64_t duration_ns = 0;
  uint64_t id = 0;
  std::optional<Error> err;
  {
    ScopeTimer timer(duration_ns);
    err = check_event(event);
    if (!err) {
      std::unique_lock<std::shared_mutex> lk(mu_);
      struct stat st {};
      if (poisoned_ || !file_) {
        err = storage_error("ledger unusable after failed rollback: " + path_);
      } else if (::fstat(::fileno(file_), &st) != 0) {
        err = storage_error("cannot stat ledger file: " + path_);
      } else {
        const LedgerRecord record{next_id_, event};
        const std::string line = record_line(record);
        const bool written = std::fwrite(line.data(), 1, line.size(), file_) == line.size();
        if (!written || std::fflush(file_) != 0) {
          err = storage_error("ledger write failed: " + path_);
          roll_back(static_cast<std::int64_t>(st.st_size));
        } else {
          id = next_id_++;
          records_.push_back(record);
        }
      }
    }
  }
  emit_append(!err, err, id, duration_ns);
  if (error) *error = err;
  return id;
}

std::vector<LedgerRecord> FileLedger::query(std::optional<ProvenanceKind> kind,
                                            std::optional<uint32_t> limit,
                                            std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return select_records(records_, kind, limit);
}

KindTotals FileLedger::aggregate(std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return sum_spans(records_);
}

KindCounts FileLedger::count_by_kind(std::optional<Error>* error) const {
  if (error) error->reset();
  std::shared_lock<std::shared_mutex> lk(mu_);
  return count_kinds(records_);
}

// Cuts the file back to size bytes after a failed write so no partial line
// or unacknowledged record survives. Caller holds mu_ exclusively.
void FileLedger::roll_back(std::int64_t size) {
  // The close may still push buffered bytes out; the truncate removes them.
  if (std::fclose(file_) != 0) {
    emit_storage_event("ledger.close", false, "close after failed write: " + path_);
  }
  file_ = nullptr;
  if (::truncate(path_.c_str(), static_cast<off_t>(size)) == 0) {
    file_ = std::fopen(path_.c_str(), "a");
  }
  poisoned_ = (file_ == nullptr);
  emit_storage_event("ledger.rollback", !poisoned_, "size=" + std::to_string(size));
}

std::optional<Error> FileLedger::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  // Truncate first: on failure the open handle and records are untouched.
  FILE* truncated = std::fopen(path_.c_str(), "w");
  if (!truncated) return storage_error("cannot truncate ledger file: " + path_);
  if (file_ && std::fclose(file_) != 0) {
    emit_storage_event("ledger.close", false, "close before truncate: " + path_);
  }
  file_ = truncated;
  records_.clear();
  next_id_ = 1;
  poisoned_ = false;
  return std::nullopt;
}

}  // namespace quill
