#include "quill/config.hpp"

#include "quill/jsonlite.hpp"
#include "quill/observability.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace quill {

namespace {

std::optional<std::size_t> parse_limit(const std::string& text) {
  if (text.empty() || text[0] < '0' || text[0] > '9') return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0') return std::nullopt;
  return static_cast<std::size_t>(v);
}

}  // namespace

Config config_from_env(std::optional<Error>* error) {
  Config c;
  if (error) error->reset();
  if (const char* e = std::getenv("QUILL_LEDGER_PATH"); e && e[0]) c.ledger_path = e;
  if (const char* e = std::getenv("QUILL_EVENT_LOG"); e && e[0]) c.event_log = e;
  if (const char* e = std::getenv("QUILL_EXCERPT_LIMIT"); e && e[0]) {
    const auto limit = parse_limit(e);
    if (limit) {
      c.excerpt_limit = *limit;
    } else if (error) {
      *error = Error{ErrorCode::invalid_input,
                     std::string("QUILL_EXCERPT_LIMIT is not a non-negative integer: ") + e};
    }
  }
  return c;
}

Config load_config_file(const std::string& path, const Config& base, std::optional<Error>* error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = Error{ErrorCode::storage_failure, "cannot read config file: " + path};
    return base;
  }
  std::stringstream buf;
  buf << in.rdbuf();

  std::optional<jsonlite::JsonError> jerr;
  const auto obj = jsonlite::parse(buf.str(), &jerr);
  if (jerr) {
    if (error) *error = Error{ErrorCode::invalid_input, "config file " + path + ": " + jerr->message};
    return base;
  }

  Config c = base;
  for (const char* key : {"ledger_path", "event_log"}) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->second.is_string()) {
      if (error) *error = Error{ErrorCode::invalid_input, std::string("config key must be a string: ") + key};
      return base;
    }
  }
  auto limit = obj.find("excerpt_limit");
  if (limit != obj.end() && !limit->second.is_u64()) {
    if (error) *error = Error{ErrorCode::invalid_input, "config key excerpt_limit must be a non-negative integer"};
    return base;
  }

  if (obj.contains("ledger_path")) c.ledger_path = jsonlite::get_string(obj, "ledger_path");
  if (obj.contains("event_log")) c.event_log = jsonlite::get_string(obj, "event_log");
  if (limit != obj.end()) c.excerpt_limit = static_cast<std::size_t>(jsonlite::get_u64(obj, "excerpt_limit"));
  if (error) error->reset();
  return c;
}

void apply_config(const Config& config) {
  set_event_log_path(config.event_log);
}

std::string config_to_json(const Config& config) {
  jsonlite::Object obj;
  obj["ledger_path"]   = jsonlite::Value{config.ledger_path};
  obj["event_log"]     = jsonlite::Value{config.event_log};
  obj["excerpt_limit"] = jsonlite::Value{static_cast<std::uint64_t>(config.excerpt_limit)};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

std::optional<Error> write_private_file(const std::string& path, const std::string& data) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600);
  if (fd < 0) {
    return Error{ErrorCode::storage_failure,
                 "cannot create " + path + ": " + std::strerror(errno)};
  }
  FILE* f = ::fdopen(fd, "w");
  if (!f) {
    ::close(fd);
    ::unlink(path.c_str());
    return Error{ErrorCode::storage_failure, "cannot open stream for " + path};
  }
  const bool written = std::fwrite(data.data(), 1, data.size(), f) == data.size();
  const bool closed = std::fclose(f) == 0;
  if (!written || !closed) {
    ::unlink(path.c_str());
    return Error{ErrorCode::storage_failure, "cannot write " + path};
  }
  return std::nullopt;
}

}  // namespace quill
