#include "quill/version.hpp"

#include <sstream>

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace quill {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver           = semver.empty() ? PROJECT_VERSION : semver;
  m.signature_scheme = "ed25519";
  m.digest_primitive = "blake3";
  m.build_timestamp  = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"semver\":\"" << m.semver << "\""
    << ",\"canonical_encoding\":" << m.canonical_encoding
    << ",\"envelope_format\":" << m.envelope_format
    << ",\"ledger_format\":" << m.ledger_format
    << ",\"digest_algorithm\":" << m.digest_algorithm
    << ",\"signature_scheme\":\"" << m.signature_scheme << "\""
    << ",\"digest_primitive\":\"" << m.digest_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

}  // namespace version
}  // namespace quill
