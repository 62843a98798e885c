// quill-verify: standalone document verifier.
//
//   quill-verify <document> [--key <base64>]
//
// exit 0: "VALID" and the report on stdout
// exit 1: "INVALID" and the report on stdout, or
//         "error [stage]: code: message" on stderr

#include <iostream>
#include <optional>
#include <string>

#include "quill/config.hpp"
#include "quill/verifier.hpp"

int main(int argc, char **argv) {
  std::string doc_path;
  std::optional<std::string> expected_key;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--key" || arg == "-k") && i + 1 < argc) {
      expected_key = argv[++i];
    } else if (doc_path.empty()) {
      doc_path = arg;
    } else {
      std::cerr << "usage: quill-verify <document> [--key <base64>]\n";
      return 1;
    }
  }
  if (doc_path.empty()) {
    std::cerr << "usage: quill-verify <document> [--key <base64>]\n";
    return 1;
  }

  // Only the event sink is used here. QUILL_EXCERPT_LIMIT has no meaning for
  // verification, so a malformed value is reported and otherwise ignored.
  std::optional<quill::Error> err;
  const auto config = quill::config_from_env(&err);
  if (err)
    std::cerr << "warning: " << err->message << "\n";
  quill::apply_config(config);

  return quill::run_verify_cli(doc_path, expected_key, std::cout, std::cerr);
}
