#pragma once

// quill/config.hpp: Runtime configuration for the quill tools.
//
// SOURCES (later wins):
//   1. built-in defaults
//   2. environment: QUILL_LEDGER_PATH, QUILL_EVENT_LOG, QUILL_EXCERPT_LIMIT
//   3. JSON file named by QUILL_CONFIG or --config:
//        {"ledger_path":"...","event_log":"...","excerpt_limit":50}
//
// Signing keys are never part of Config. They come from QUILL_SIGNING_KEY or
// --key-file and are handled by the CLI only.

#include <cstddef>
#include <optional>
#include <string>

#include "quill/types.hpp"

namespace quill {

struct Config {
  std::string ledger_path{".quill/ledger.ndjson"};
  std::string event_log;  // empty = no file sink
  std::size_t excerpt_limit{50};
};

// Defaults overlaid with environment variables. A malformed
// QUILL_EXCERPT_LIMIT is invalid_input; the default is kept.
Config config_from_env(std::optional<Error>* error);

// Overlays the keys present in a JSON config file onto base. Unknown keys are
// ignored. A missing file is storage_failure, bad JSON or a mistyped key is
// invalid_input; base is returned unchanged in both cases.
Config load_config_file(const std::string& path, const Config& base, std::optional<Error>* error);

// Routes the observability file sink to config.event_log.
void apply_config(const Config& config);

std::string config_to_json(const Config& config);

// Creates path with mode 0600 and writes data. The file must not already
// exist, so a stale or attacker-placed file is never reused. Any failure is
// storage_failure; a partially written file is removed.
std::optional<Error> write_private_file(const std::string& path, const std::string& data);

}  // namespace quill
