#pragma once

// quill/version.hpp: Version constants for every persisted or signed format.
//
// INVARIANT:
//   A document signed under one CANONICAL_ENCODING_VERSION can only be
//   verified by a build that implements the same version. Never change
//   canonical_encode() without bumping it.

#include <cstdint>
#include <string>

namespace quill {
namespace version {

// Bytes fed to sign()/verify(). Version 1 = four sorted keys, "%.6f" trimmed
// percentages, events excluded (see manifest.hpp).
constexpr uint32_t CANONICAL_ENCODING_VERSION = 1;

// Envelope JSON and the <script id="quill-manifest"> wrapper.
constexpr uint32_t ENVELOPE_FORMAT_VERSION = 1;

// NDJSON ledger line layout (see FileLedger).
constexpr uint32_t LEDGER_FORMAT_VERSION = 1;

// content_digest(): BLAKE3, "txt:" domain prefix, 64 hex chars.
constexpr uint32_t DIGEST_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t canonical_encoding{CANONICAL_ENCODING_VERSION};
  uint32_t envelope_format{ENVELOPE_FORMAT_VERSION};
  uint32_t ledger_format{LEDGER_FORMAT_VERSION};
  uint32_t digest_algorithm{DIGEST_ALGORITHM_VERSION};
  std::string semver;             // PROJECT_VERSION from the build
  std::string signature_scheme;   // "ed25519"
  std::string digest_primitive;   // "blake3"
  std::string build_timestamp;    // __DATE__ "T" __TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

}  // namespace version
}  // namespace quill
