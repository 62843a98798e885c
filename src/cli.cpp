#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <openssl/crypto.h>

#include "quill/config.hpp"
#include "quill/envelope.hpp"
#include "quill/hash.hpp"
#include "quill/jsonlite.hpp"
#include "quill/ledger.hpp"
#include "quill/manifest.hpp"
#include "quill/observability.hpp"
#include "quill/signature.hpp"
#include "quill/verifier.hpp"
#include "quill/version.hpp"

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.1.0"
#endif

namespace {

bool read_file(const std::string &path, std::string *out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs)
    return false;
  out->assign((std::istreambuf_iterator<char>(ifs)),
              std::istreambuf_iterator<char>());
  return true;
}

bool write_file(const std::string &path, const std::string &data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
  return static_cast<bool>(ofs);
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

int fail(const quill::Error &e) {
  std::cerr << "{\"error\":{\"code\":\"" << quill::to_string(e.code)
            << "\",\"message\":\"" << quill::jsonlite::escape(e.message)
            << "\"}}\n";
  return 2;
}

int usage() {
  std::cerr
      << "usage: quill [--config FILE] <command> [options]\n"
         "  health | version | config\n"
         "  keygen --out FILE\n"
         "  digest (--text T | --file F)\n"
         "  log --kind human|ai|cited --source S (--text T | --digest D)\n"
         "      [--span N] [--timestamp ISO8601]\n"
         "  history [--kind K] [--limit N]\n"
         "  counts\n"
         "  manifest [--limit N]\n"
         "  sign --in DOC --out DOC [--key-file FILE] [--limit N]\n"
         "  verify DOC [--key BASE64]\n"
         "  clear\n";
  return 1;
}

// UTF-8 code points, not bytes.
uint64_t character_count(const std::string &text) {
  uint64_t n = 0;
  for (unsigned char c : text)
    if ((c & 0xC0) != 0x80)
      ++n;
  return n;
}

std::string utc_now_iso8601() {
  const std::time_t t =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::optional<uint64_t> parse_u64(const std::string &s) {
  if (s.empty() || s[0] < '0' || s[0] > '9')
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0')
    return std::nullopt;
  return static_cast<uint64_t>(v);
}

// QUILL_SIGNING_KEY (base64) unless --key-file is given. The key never leaves
// this function except as the returned bytes.
quill::Bytes load_signing_key(const std::string &key_file,
                              std::optional<quill::Error> *error) {
  std::string text;
  if (!key_file.empty()) {
    if (!read_file(key_file, &text)) {
      *error = quill::Error{quill::ErrorCode::invalid_input,
                            "cannot read key file: " + key_file};
      return {};
    }
  } else if (const char *e = std::getenv("QUILL_SIGNING_KEY"); e && e[0]) {
    text = e;
  } else {
    *error = quill::Error{quill::ErrorCode::invalid_input,
                          "no signing key: set QUILL_SIGNING_KEY or pass "
                          "--key-file"};
    return {};
  }
  auto key = quill::base64_decode(trim(text), error);
  if (*error)
    return {};
  if (key.size() != quill::kSigningKeyBytes) {
    *error = quill::Error{quill::ErrorCode::invalid_key_length,
                          "signing key must be " +
                              std::to_string(quill::kSigningKeyBytes) +
                              " bytes"};
    return {};
  }
  return key;
}

std::string record_to_json(const quill::LedgerRecord &r) {
  auto obj = quill::event_to_object(r.event);
  obj["id"] = quill::jsonlite::Value{static_cast<std::uint64_t>(r.id)};
  return quill::jsonlite::to_json(quill::jsonlite::Value{std::move(obj)});
}

} // namespace

int main(int argc, char **argv) {
  std::string cmd;
  std::string config_path;
  int cmd_index = 0;
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    cmd = argv[i];
    cmd_index = i;
    break;
  }
  if (cmd.empty())
    return usage();

  std::optional<quill::Error> err;
  quill::Config config = quill::config_from_env(&err);
  if (err)
    return fail(*err);
  if (config_path.empty()) {
    if (const char *e = std::getenv("QUILL_CONFIG"); e && e[0])
      config_path = e;
  }
  if (!config_path.empty()) {
    config = quill::load_config_file(config_path, config, &err);
    if (err)
      return fail(*err);
  }
  quill::apply_config(config);

  // Subcommand arguments start after the command word.
  const int first = cmd_index + 1;
  auto flag = [&](const std::string &name) -> std::string {
    for (int i = first; i + 1 < argc; ++i)
      if (std::string(argv[i]) == name)
        return argv[i + 1];
    return "";
  };
  auto limit_flag = [&](std::optional<uint32_t> *out) -> bool {
    const std::string s = flag("--limit");
    if (s.empty())
      return true;
    const auto v = parse_u64(s);
    if (!v || *v > UINT32_MAX)
      return false;
    *out = static_cast<uint32_t>(*v);
    return true;
  };

  if (cmd == "health") {
    const bool vectors_ok =
        quill::blake3_hex("") ==
        "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262";
    std::optional<quill::Error> kerr;
    const auto kp = quill::ed25519().generate_keypair(&kerr);
    bool sign_ok = false;
    if (!kerr) {
      const auto sig = quill::ed25519().sign("health", kp.signing_key, &kerr);
      sign_ok = !kerr && quill::ed25519().verify("health", sig,
                                                 kp.verifying_key, &kerr);
    }
    const bool ok = vectors_ok && sign_ok;
    std::cout << "{\"ok\":" << (ok ? "true" : "false")
              << ",\"digest_primitive\":\"blake3\""
              << ",\"blake3_version\":\"" << quill::blake3_library_version()
              << "\",\"hash_vectors\":" << (vectors_ok ? "true" : "false")
              << ",\"signature_scheme\":\"" << quill::ed25519().algorithm()
              << "\",\"signature_self_test\":" << (sign_ok ? "true" : "false")
              << ",\"openssl_version\":\""
              << OpenSSL_version(OPENSSL_VERSION_STRING) << "\"}\n";
    return ok ? 0 : 2;
  }

  if (cmd == "version") {
    std::cout << quill::version::manifest_to_json(
                     quill::version::current_manifest(PROJECT_VERSION))
              << "\n";
    return 0;
  }

  if (cmd == "config") {
    std::cout << quill::config_to_json(config) << "\n";
    return 0;
  }

  if (cmd == "keygen") {
    const std::string out = flag("--out");
    if (out.empty())
      return usage();
    const auto kp = quill::ed25519().generate_keypair(&err);
    if (err)
      return fail(*err);
    if (auto werr = quill::write_private_file(
            out, quill::base64_encode(kp.signing_key) + "\n"))
      return fail(*werr);
    std::cout << "{\"key_file\":\"" << quill::jsonlite::escape(out)
              << "\",\"public_key\":\""
              << quill::base64_encode(kp.verifying_key) << "\"}\n";
    return 0;
  }

  if (cmd == "digest") {
    std::string text = flag("--text");
    const std::string file = flag("--file");
    if (!file.empty() && !read_file(file, &text))
      return fail({quill::ErrorCode::invalid_input, "cannot read " + file});
    std::cout << "{\"content_digest\":\"" << quill::content_digest(text)
              << "\",\"characters\":" << character_count(text) << "}\n";
    return 0;
  }

  if (cmd == "verify") {
    if (first >= argc)
      return usage();
    const std::string doc_path = argv[first];
    std::optional<std::string> expected_key;
    const std::string key = flag("--key");
    if (!key.empty())
      expected_key = key;
    return quill::run_verify_cli(doc_path, expected_key, std::cout, std::cerr);
  }

  // Everything below works on the configured ledger file.
  auto ledger = quill::FileLedger::open(config.ledger_path, &err);
  if (!ledger)
    return fail(err.value_or(quill::Error{quill::ErrorCode::storage_failure,
                                          "cannot open ledger"}));

  if (cmd == "log") {
    const auto kind = quill::parse_kind(flag("--kind"));
    if (!kind)
      return fail({quill::ErrorCode::invalid_input,
                   "--kind must be one of human, ai, cited"});
    quill::ProvenanceEvent ev;
    ev.kind = *kind;
    ev.source = flag("--source");
    ev.timestamp = flag("--timestamp");
    if (ev.timestamp.empty())
      ev.timestamp = utc_now_iso8601();
    const std::string text = flag("--text");
    ev.content_digest =
        text.empty() ? flag("--digest") : quill::content_digest(text);
    const std::string span = flag("--span");
    if (!span.empty()) {
      const auto v = parse_u64(span);
      if (!v)
        return fail({quill::ErrorCode::invalid_input,
                     "--span must be a non-negative integer"});
      ev.span_length = *v;
    } else {
      ev.span_length = character_count(text);
    }
    const uint64_t id = ledger->append(ev, &err);
    if (err)
      return fail(*err);
    std::cout << "{\"id\":" << id << "}\n";
    return 0;
  }

  if (cmd == "history") {
    std::optional<quill::ProvenanceKind> kind;
    const std::string kind_name = flag("--kind");
    if (!kind_name.empty()) {
      kind = quill::parse_kind(kind_name);
      if (!kind)
        return fail({quill::ErrorCode::invalid_input,
                     "unknown kind: " + kind_name});
    }
    std::optional<uint32_t> limit;
    if (!limit_flag(&limit))
      return fail({quill::ErrorCode::invalid_input,
                   "--limit must be a non-negative integer"});
    const auto records = ledger->query(kind, limit, &err);
    if (err)
      return fail(*err);
    for (const auto &r : records)
      std::cout << record_to_json(r) << "\n";
    return 0;
  }

  if (cmd == "counts") {
    const auto counts = ledger->count_by_kind(&err);
    if (err)
      return fail(*err);
    const auto totals = ledger->aggregate(&err);
    if (err)
      return fail(*err);
    std::cout << "{\"events\":{\"human\":" << counts.human
              << ",\"ai\":" << counts.ai << ",\"cited\":" << counts.cited
              << "},\"characters\":{\"human\":" << totals.human
              << ",\"ai\":" << totals.ai << ",\"cited\":" << totals.cited
              << "}}\n";
    return 0;
  }

  if (cmd == "manifest" || cmd == "sign") {
    std::optional<uint32_t> limit;
    if (!limit_flag(&limit))
      return fail({quill::ErrorCode::invalid_input,
                   "--limit must be a non-negative integer"});
    const std::size_t excerpt = limit ? *limit : config.excerpt_limit;
    const auto manifest = quill::build_manifest(*ledger, excerpt, &err);
    if (err)
      return fail(*err);

    if (cmd == "manifest") {
      std::cout << "{\"canonical\":\""
                << quill::jsonlite::escape(quill::canonical_encode(manifest))
                << "\",\"manifest\":"
                << quill::jsonlite::to_json(quill::jsonlite::Value{
                       quill::manifest_to_object(manifest)})
                << "}\n";
      return 0;
    }

    const std::string in = flag("--in");
    const std::string out = flag("--out");
    if (in.empty() || out.empty())
      return usage();
    std::string document;
    if (!read_file(in, &document))
      return fail({quill::ErrorCode::invalid_input, "cannot read " + in});
    const auto signing_key = load_signing_key(flag("--key-file"), &err);
    if (err)
      return fail(*err);
    const auto envelope =
        quill::sign_manifest(manifest, signing_key, quill::ed25519(), &err);
    if (err)
      return fail(*err);
    if (!write_file(out, quill::embed_envelope(document, envelope)))
      return fail({quill::ErrorCode::storage_failure, "cannot write " + out});
    std::cout << "{\"out\":\"" << quill::jsonlite::escape(out)
              << "\",\"public_key\":\""
              << quill::base64_encode(envelope.public_key)
              << "\",\"total_characters\":" << manifest.total_characters
              << "}\n";
    return 0;
  }

  if (cmd == "clear") {
    if (auto cerr = ledger->clear())
      return fail(*cerr);
    std::cout << "{\"cleared\":true}\n";
    return 0;
  }

  return usage();
}
