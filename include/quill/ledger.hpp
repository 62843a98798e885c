#pragma once

// quill/ledger.hpp: Append-only provenance ledger.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: events are never modified. clear() is the only removal and
//      is a development/test operation; nothing on the signing path calls it.
//   2. SEQUENTIAL IDS: append() assigns 1, 2, 3, ... under an exclusive lock.
//      Concurrent appends never share or skip an id. clear() resets to 1.
//   3. NO PLAINTEXT: append() rejects any event whose content_digest is not a
//      64-char hex digest, so raw text cannot be stored by accident.
//   4. QUERY ORDER: timestamp descending; equal timestamps return the
//      newest-inserted (highest id) first.
//
// The ledger is an explicit handle. Callers construct a backend and pass it to
// every operation (build_manifest() included); there is no process-wide store,
// so independent instances can be used concurrently in tests.
//
// Reads take a shared lock and observe a consistent snapshot. A storage_failure
// from append() means nothing was recorded: FileLedger truncates the failed
// write away, or refuses further appends when it cannot.

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "quill/jsonlite.hpp"
#include "quill/types.hpp"

namespace quill {

class LedgerBackend {
 public:
  virtual ~LedgerBackend() = default;

  // Returns the assigned id (>= 1), or 0 with *error set.
  virtual uint64_t append(const ProvenanceEvent& event, std::optional<Error>* error) = 0;

  // Newest first, optionally filtered by kind and truncated to limit.
  virtual std::vector<LedgerRecord> query(std::optional<ProvenanceKind> kind,
                                          std::optional<uint32_t> limit,
                                          std::optional<Error>* error) const = 0;

  // Per-kind sums of span_length over the whole ledger.
  virtual KindTotals aggregate(std::optional<Error>* error) const = 0;

  // Per-kind event counts over the whole ledger.
  virtual KindCounts count_by_kind(std::optional<Error>* error) const = 0;

  // Empties the ledger and resets id assignment.
  virtual std::optional<Error> clear() = 0;

  virtual std::string backend_id() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryLedger: in-process store
// ---------------------------------------------------------------------------
class MemoryLedger : public LedgerBackend {
 public:
  uint64_t append(const ProvenanceEvent& event, std::optional<Error>* error) override;
  std::vector<LedgerRecord> query(std::optional<ProvenanceKind> kind,
                                  std::optional<uint32_t> limit,
                                  std::optional<Error>* error) const override;
  KindTotals aggregate(std::optional<Error>* error) const override;
  KindCounts count_by_kind(std::optional<Error>* error) const override;
  std::optional<Error> clear() override;
  std::string backend_id() const override { return "memory"; }

 private:
  mutable std::shared_mutex mu_;
  std::vector<LedgerRecord> records_;
  uint64_t next_id_{1};
};

// ---------------------------------------------------------------------------
// FileLedger: NDJSON file, one record per line, reloaded on open
// ---------------------------------------------------------------------------
// Line format (sorted keys, compact):
//   {"content_digest":"..","id":1,"kind":"human","source":"..","span_length":10,"timestamp":".."}
//
// Every append is written and flushed before the in-memory index is updated.
// A failed write is truncated away, so the file never holds a partial line or
// a record whose id was not returned.
// A line that fails to parse on reload is a storage_failure: the file is never
// silently repaired or truncated.
class FileLedger : public LedgerBackend {
 public:
  // Opens (creating if absent) the ledger at path. Parent directories are
  // created. Returns nullptr with *error set on any I/O or parse failure.
  static std::unique_ptr<FileLedger> open(const std::string& path, std::optional<Error>* error);

  ~FileLedger() override;
  FileLedger(const FileLedger&) = delete;
  FileLedger& operator=(const FileLedger&) = delete;

  uint64_t append(const ProvenanceEvent& event, std::optional<Error>* error) override;
  std::vector<LedgerRecord> query(std::optional<ProvenanceKind> kind,
                                  std::optional<uint32_t> limit,
                                  std::optional<Error>* error) const override;
  KindTotals aggregate(std::optional<Error>* error) const override;
  KindCounts count_by_kind(std::optional<Error>* error) const override;
  std::optional<Error> clear() override;
  std::string backend_id() const override { return "file:" + path_; }

  const std::string& path() const { return path_; }

  // True once a failed write could not be rolled back. Every later append is
  // rejected with storage_failure until clear() succeeds.
  bool poisoned() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return poisoned_;
  }

 private:
  explicit FileLedger(std::string path) : path_(std::move(path)) {}

  void roll_back(std::int64_t size);

  std::string path_;
  FILE* file_{nullptr};
  bool poisoned_{false};
  mutable std::shared_mutex mu_;
  std::vector<LedgerRecord> records_;
  uint64_t next_id_{1};
};

// ---------------------------------------------------------------------------
// Event JSON codec (ledger file lines and envelope excerpts)
// ---------------------------------------------------------------------------
jsonlite::Object event_to_object(const ProvenanceEvent& event);

// Strict: every field present with the right type; unknown kind is invalid_input.
ProvenanceEvent event_from_object(const jsonlite::Object& obj, std::optional<Error>* error);

}  // namespace quill
