#include "quill/verifier.hpp"

#include "quill/envelope.hpp"
#include "quill/ledger.hpp"
#include "quill/manifest.hpp"
#include "quill/observability.hpp"

#include <fstream>
#include <iterator>
#include <variant>

namespace quill {

namespace {

Error structure_error(const std::string& field, const std::string& problem) {
  return Error{ErrorCode::invalid_structure, "envelope field " + field + " " + problem};
}

std::optional<double> percentage_field(const jsonlite::Object& manifest, const std::string& key,
                                       std::optional<Error>* error) {
  auto it = manifest.find(key);
  if (it == manifest.end()) {
    *error = structure_error("manifest." + key, "is missing");
    return std::nullopt;
  }
  if (!it->second.is_number()) {
    *error = structure_error("manifest." + key, "must be a number");
    return std::nullopt;
  }
  double value = 0.0;
  if (const auto* u = std::get_if<std::uint64_t>(&it->second.v)) {
    value = static_cast<double>(*u);
  } else {
    value = std::get<double>(it->second.v);
  }
  if (!(value >= 0.0 && value <= 100.0)) {
    *error = structure_error("manifest." + key, "must be within [0, 100]");
    return std::nullopt;
  }
  return value;
}

// Structural checks and conversion to ManifestData. Stops at the first problem.
std::optional<Error> validate_envelope(const jsonlite::Object& envelope, VerificationResult* out) {
  auto manifest_it = envelope.find("manifest");
  if (manifest_it == envelope.end()) return structure_error("manifest", "is missing");
  if (!manifest_it->second.is_object()) return structure_error("manifest", "must be an object");

  auto sig_it = envelope.find("signature");
  if (sig_it == envelope.end()) return structure_error("signature", "is missing");
  if (!sig_it->second.is_string()) return structure_error("signature", "must be a string");

  auto pk_it = envelope.find("public_key");
  if (pk_it == envelope.end()) return structure_error("public_key", "is missing");
  if (!pk_it->second.is_string()) return structure_error("public_key", "must be a string");

  const auto& manifest = std::get<jsonlite::Object>(manifest_it->second.v);
  out->manifest_json = manifest;
  out->public_key    = std::get<std::string>(pk_it->second.v);

  std::optional<Error> err;
  ManifestData data;
  const auto human = percentage_field(manifest, "human_percentage", &err);
  if (!human) return err;
  const auto ai = percentage_field(manifest, "ai_percentage", &err);
  if (!ai) return err;
  const auto cited = percentage_field(manifest, "cited_percentage", &err);
  if (!cited) return err;
  data.human_percentage = *human;
  data.ai_percentage    = *ai;
  data.cited_percentage = *cited;

  auto total_it = manifest.find("total_characters");
  if (total_it == manifest.end()) return structure_error("manifest.total_characters", "is missing");
  if (!total_it->second.is_u64()) {
    return structure_error("manifest.total_characters", "must be a non-negative integer");
  }
  data.total_characters = std::get<std::uint64_t>(total_it->second.v);

  auto events_it = manifest.find("events");
  if (events_it != manifest.end()) {
    if (!events_it->second.is_array()) return structure_error("manifest.events", "must be an array");
    const auto& events = std::get<jsonlite::Array>(events_it->second.v);
    for (std::size_t i = 0; i < events.size(); ++i) {
      const std::string field = "manifest.events[" + std::to_string(i) + "]";
      if (!events[i].is_object()) return structure_error(field, "must be an object");
      std::optional<Error> eerr;
      auto ev = event_from_object(std::get<jsonlite::Object>(events[i].v), &eerr);
      if (eerr) return structure_error(field, "is invalid: " + eerr->message);
      data.events.push_back(std::move(ev));
    }
  }
  out->manifest = std::move(data);
  return std::nullopt;
}

std::string signature_text(const jsonlite::Object& envelope) {
  return jsonlite::get_string(envelope, "signature");
}

}  // namespace

std::string to_string(VerifyStage stage) {
  switch (stage) {
    case VerifyStage::extraction: return "extraction";
    case VerifyStage::structural_validation: return "structural_validation";
    case VerifyStage::key_match: return "key_match";
    case VerifyStage::decoding: return "decoding";
    case VerifyStage::signature_check: return "signature_check";
  }
  return "unknown";
}

jsonlite::Object extract_envelope(const std::string& document, std::optional<Error>* error) {
  const ScriptLocation loc = locate_manifest_script(document);
  if (loc.result == ScanResult::absent) {
    if (error) *error = Error{ErrorCode::not_found, "no quill-manifest script in document"};
    return {};
  }
  if (loc.result == ScanResult::unterminated) {
    if (error) *error = Error{ErrorCode::malformed, "quill-manifest script is not terminated"};
    return {};
  }
  const std::string content = document.substr(loc.content_begin, loc.content_end - loc.content_begin);
  std::optional<jsonlite::JsonError> jerr;
  auto envelope = jsonlite::parse(content, &jerr);
  if (jerr) {
    if (error) *error = Error{ErrorCode::malformed, "quill-manifest content: " + jerr->message};
    return {};
  }
  if (error) error->reset();
  return envelope;
}

VerificationResult verify_document(const std::string& document,
                                   const std::optional<std::string>& expected_public_key,
                                   const SignatureScheme& scheme,
                                   std::optional<Error>* error) {
  VerificationResult result;
  std::optional<Error> err;
  uint64_t duration_ns = 0;
  {
    ScopeTimer timer(duration_ns);
    // Single pass; each failing stage breaks out with err set.
    do {
      result.stage = VerifyStage::extraction;
      const auto envelope = extract_envelope(document, &err);
      if (err) break;

      result.stage = VerifyStage::structural_validation;
      err = validate_envelope(envelope, &result);
      if (err) break;

      result.stage = VerifyStage::key_match;
      if (expected_public_key && *expected_public_key != result.public_key) {
        err = Error{ErrorCode::key_mismatch, "embedded public key does not match the expected key"};
        break;
      }

      result.stage = VerifyStage::decoding;
      std::optional<Error> derr;
      const Bytes public_key = base64_decode(result.public_key, &derr);
      if (derr) {
        err = Error{derr->code, "public_key: " + derr->message};
        break;
      }
      const Bytes signature = base64_decode(signature_text(envelope), &derr);
      if (derr) {
        err = Error{derr->code, "signature: " + derr->message};
        break;
      }
      if (public_key.size() != kVerifyingKeyBytes) {
        err = Error{ErrorCode::invalid_key_length,
                    "public_key must be " + std::to_string(kVerifyingKeyBytes) + " bytes, got " +
                        std::to_string(public_key.size())};
        break;
      }
      if (signature.size() != kSignatureBytes) {
        err = Error{ErrorCode::invalid_signature_length,
                    "signature must be " + std::to_string(kSignatureBytes) + " bytes, got " +
                        std::to_string(signature.size())};
        break;
      }

      result.stage = VerifyStage::signature_check;
      const std::string message = canonical_encode(result.manifest);
      result.valid = scheme.verify(message, signature, public_key, &err);
    } while (false);
  }

  OperationEvent ev;
  ev.operation   = "verify";
  ev.ok          = !err && result.valid;
  ev.error_code  = err ? to_string(err->code) : "";
  ev.duration_ns = duration_ns;
  ev.detail      = "stage=" + to_string(result.stage) + " valid=" + (result.valid ? "true" : "false");
  emit_operation_event(ev);

  if (error) *error = err;
  return result;
}

std::string verification_report_json(const VerificationResult& result) {
  jsonlite::Object obj;
  obj["valid"]      = jsonlite::Value{result.valid};
  obj["public_key"] = jsonlite::Value{result.public_key};
  obj["manifest"]   = jsonlite::Value{result.manifest_json};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

std::string format_stage_error(VerifyStage stage, const Error& error) {
  return "error [" + to_string(stage) + "]: " + to_string(error.code) + ": " + error.message;
}

int run_verify_cli(const std::string& doc_path,
                   const std::optional<std::string>& expected_public_key,
                   std::ostream& out, std::ostream& err) {
  std::ifstream ifs(doc_path, std::ios::binary);
  if (!ifs) {
    err << format_stage_error(VerifyStage::extraction,
                              Error{ErrorCode::invalid_input, "cannot read " + doc_path})
        << "\n";
    return 1;
  }
  const std::string document((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());

  std::optional<Error> error;
  const auto result = verify_document(document, expected_public_key, ed25519(), &error);
  if (error) {
    err << format_stage_error(result.stage, *error) << "\n";
    return 1;
  }
  out << (result.valid ? "VALID" : "INVALID") << "\n"
      << verification_report_json(result) << "\n";
  return result.valid ? 0 : 1;
}

}  // namespace quill
