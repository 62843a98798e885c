#pragma once

// quill/types.hpp: Core data structures for provenance ledgers and signed manifests.
//
// DATA MODEL:
//   ProvenanceEvent : one attributed span (kind, digest of the text, source, length).
//   LedgerRecord    : a ProvenanceEvent plus the id assigned by the ledger on append.
//   ManifestData    : percentage breakdown + bounded excerpt of recent events.
//   SignedEnvelope  : {manifest, signature, public_key}, the unit embedded in documents.
//
// INVARIANTS:
//   - The ledger never sees raw text. content_digest is always 64 lowercase hex chars.
//   - Events are immutable once appended. There is no update path.
//   - ManifestData::events is ADVISORY: the signature binds the percentages and
//     total_characters only (see canonical_encode() in manifest.hpp).
//
// ERROR REPORTING:
//   No exceptions cross the library API. Fallible operations return
//   std::optional<Error> (or take a std::optional<Error>* out-parameter), in the
//   same shape as jsonlite::JsonError.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quill {

enum class ErrorCode {
  none,
  invalid_input,             // empty message, malformed event, unknown kind
  invalid_key_length,        // key is not the algorithm's fixed size
  invalid_signature_length,  // signature is not the algorithm's fixed size
  invalid_encoding,          // bad base64
  malformed,                 // envelope marker present, content not a JSON object
  not_found,                 // no envelope marker in the document
  invalid_structure,         // required envelope field missing or mistyped
  key_mismatch,              // caller-supplied key differs from embedded key
  storage_failure,           // opaque ledger backend failure
  rng_failure,               // CSPRNG could not produce key material
};

std::string to_string(ErrorCode code);

struct Error {
  ErrorCode   code{ErrorCode::none};
  std::string message;
};

// ---------------------------------------------------------------------------
// ProvenanceKind: closed set. Wire names: "human", "ai", "cited".
// ---------------------------------------------------------------------------
enum class ProvenanceKind { human, ai, cited };

std::string to_string(ProvenanceKind kind);

// Returns nullopt for anything outside the closed set. Never coerces.
std::optional<ProvenanceKind> parse_kind(const std::string& name);

struct ProvenanceEvent {
  std::string    timestamp;       // ISO-8601, caller-supplied
  ProvenanceKind kind{ProvenanceKind::human};
  std::string    content_digest;  // 64 hex chars (32-byte digest)
  std::string    source;          // author id, model name, citation id
  uint64_t       span_length{0};  // characters attributed to this event
};

bool operator==(const ProvenanceEvent& a, const ProvenanceEvent& b);

// Every problem found with the event, in field order. Empty = valid.
std::vector<std::string> validate_event(const ProvenanceEvent& event);

struct LedgerRecord {
  uint64_t        id{0};
  ProvenanceEvent event;
};

// Per-kind character totals, as returned by LedgerBackend::aggregate().
struct KindTotals {
  uint64_t human{0};
  uint64_t ai{0};
  uint64_t cited{0};

  uint64_t total() const { return human + ai + cited; }
};

struct KindCounts {
  uint64_t human{0};
  uint64_t ai{0};
  uint64_t cited{0};
};

struct ManifestData {
  double   human_percentage{0.0};
  double   ai_percentage{0.0};
  double   cited_percentage{0.0};
  uint64_t total_characters{0};
  // Most recent N events, newest first. Advisory only; not signed.
  std::vector<ProvenanceEvent> events;
};

// ---------------------------------------------------------------------------
// Key material (Ed25519 sizes). signing_key must never be logged or persisted
// by the library.
// ---------------------------------------------------------------------------
constexpr std::size_t kSigningKeyBytes   = 32;
constexpr std::size_t kVerifyingKeyBytes = 32;
constexpr std::size_t kSignatureBytes    = 64;

using Bytes = std::vector<uint8_t>;

struct KeyPair {
  Bytes signing_key;    // 32-byte seed
  Bytes verifying_key;  // 32-byte public key
};

struct SignedEnvelope {
  ManifestData manifest;
  Bytes        signature;
  Bytes        public_key;
};

}  // namespace quill
