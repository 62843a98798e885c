#include "quill/types.hpp"

#include "quill/hash.hpp"

namespace quill {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::invalid_input: return "invalid_input";
    case ErrorCode::invalid_key_length: return "invalid_key_length";
    case ErrorCode::invalid_signature_length: return "invalid_signature_length";
    case ErrorCode::invalid_encoding: return "invalid_encoding";
    case ErrorCode::malformed: return "malformed";
    case ErrorCode::not_found: return "not_found";
    case ErrorCode::invalid_structure: return "invalid_structure";
    case ErrorCode::key_mismatch: return "key_mismatch";
    case ErrorCode::storage_failure: return "storage_failure";
    case ErrorCode::rng_failure: return "rng_failure";
  }
  return "";
}

std::string to_string(ProvenanceKind kind) {
  switch (kind) {
    case ProvenanceKind::human: return "human";
    case ProvenanceKind::ai: return "ai";
    case ProvenanceKind::cited: return "cited";
  }
  return "";
}

std::optional<ProvenanceKind> parse_kind(const std::string& name) {
  if (name == "human") return ProvenanceKind::human;
  if (name == "ai") return ProvenanceKind::ai;
  if (name == "cited") return ProvenanceKind::cited;
  return std::nullopt;
}

bool operator==(const ProvenanceEvent& a, const ProvenanceEvent& b) {
  return a.timestamp == b.timestamp && a.kind == b.kind &&
         a.content_digest == b.content_digest && a.source == b.source &&
         a.span_length == b.span_length;
}

std::vector<std::string> validate_event(const ProvenanceEvent& event) {
  std::vector<std::string> errors;
  if (event.timestamp.empty()) errors.push_back("timestamp is required");
  if (!is_hex_digest(event.content_digest)) {
    errors.push_back("content_digest must be 64 hex characters");
  }
  if (event.source.empty()) errors.push_back("source is required");
  return errors;
}

}  // namespace quill
