#pragma once

// quill/jsonlite.hpp: Minimal strict JSON reader/writer.
//
// Used for three surfaces:
//   - the NDJSON ledger file (one event object per line),
//   - the embedded envelope (written by the embedder, read by the verifier),
//   - the optional JSON config file.
//
// The parser keeps integers and fractional numbers apart (uint64 vs double) so
// callers can tell "100" from "100.0" when validating. Objects are std::map,
// so to_json() always writes keys in sorted order.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quill::jsonlite {

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v{nullptr};

  Value() = default;
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_u64() const { return std::holds_alternative<std::uint64_t>(v); }
  bool is_number() const {
    return std::holds_alternative<std::uint64_t>(v) || std::holds_alternative<double>(v);
  }
};

// Parse any JSON value. Trailing non-whitespace is an error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object and sets *error if the text is
// not exactly one object.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Compact serialization, sorted keys, doubles via format_double().
std::string to_json(const Value& v);

// "%.6f", trailing zeros trimmed, at least one fractional digit ("60.0").
std::string format_double(double d);

std::string escape(const std::string& s);

// Type-checked lookups. A missing key or wrong type yields def.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);

}  // namespace quill::jsonlite
