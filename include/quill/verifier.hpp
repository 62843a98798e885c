#pragma once

// quill/verifier.hpp: Extract, validate and cryptographically check an
// embedded provenance envelope.
//
// PIPELINE (each stage reports its own failure, in this order):
//   extraction            locate the quill-manifest script, parse JSON object
//                         no marker -> not_found; unterminated/bad JSON -> malformed
//   structural_validation manifest/signature/public_key present and typed
//                         -> invalid_structure naming the field
//   key_match             optional expected key, compared as base64 text
//                         -> key_mismatch
//   decoding              base64 -> bytes, fixed sizes
//                         -> invalid_encoding / invalid_*_length
//   signature_check       canonical_encode(manifest), scheme.verify()
//                         a wrong signature is valid=false, not an error
//
// No SignatureScheme call is made until structural_validation has passed.

#include <optional>
#include <ostream>
#include <string>

#include "quill/jsonlite.hpp"
#include "quill/signature.hpp"
#include "quill/types.hpp"

namespace quill {

enum class VerifyStage {
  extraction,
  structural_validation,
  key_match,
  decoding,
  signature_check,
};

std::string to_string(VerifyStage stage);

struct VerificationResult {
  bool             valid{false};
  std::string      public_key;     // base64, as embedded
  jsonlite::Object manifest_json;  // manifest object as extracted
  ManifestData     manifest;       // typed view, filled after validation
  VerifyStage      stage{VerifyStage::extraction};  // last stage reached
};

// Returns the result; *error is set when a stage fails before signature_check
// completes. valid=false with no error means the signature did not verify.
VerificationResult verify_document(const std::string& document,
                                   const std::optional<std::string>& expected_public_key,
                                   const SignatureScheme& scheme,
                                   std::optional<Error>* error);

// Extraction stage alone: the envelope object, or an empty object with
// *error set to not_found / malformed.
jsonlite::Object extract_envelope(const std::string& document, std::optional<Error>* error);

// {"manifest":{...},"public_key":"...","valid":bool} for CLI reports.
std::string verification_report_json(const VerificationResult& result);

// "error [stage]: code: message"
std::string format_stage_error(VerifyStage stage, const Error& error);

// Shared body of `quill verify` and `quill-verify`: reads doc_path, verifies
// it with Ed25519 and prints "VALID"/"INVALID" plus the report to out, or the
// stage error to err. Returns the process exit code (0 valid, 1 otherwise).
int run_verify_cli(const std::string& doc_path,
                   const std::optional<std::string>& expected_public_key,
                   std::ostream& out, std::ostream& err);

}  // namespace quill
