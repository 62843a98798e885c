#include "quill/envelope.hpp"

#include "quill/jsonlite.hpp"
#include "quill/manifest.hpp"

#include <cctype>

namespace quill {

namespace {

char lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

bool iequals_at(std::string_view s, std::size_t pos, std::string_view word) {
  if (pos + word.size() > s.size()) return false;
  for (std::size_t k = 0; k < word.size(); ++k) {
    if (lower(s[pos + k]) != word[k]) return false;
  }
  return true;
}

std::size_t ifind(std::string_view s, std::string_view word, std::size_t from) {
  for (std::size_t i = from; i + word.size() <= s.size(); ++i) {
    if (iequals_at(s, i, word)) return i;
  }
  return std::string_view::npos;
}

std::size_t irfind(std::string_view s, std::string_view word) {
  if (word.size() > s.size()) return std::string_view::npos;
  for (std::size_t i = s.size() - word.size() + 1; i-- > 0;) {
    if (iequals_at(s, i, word)) return i;
  }
  return std::string_view::npos;
}

struct TagScan {
  bool        complete{false};  // reached '>'
  bool        self_closing{false};
  std::size_t end{0};           // one past '>'
  std::string id;
};

// Parses attributes starting right after "<script". Stops at '>' or EOF.
TagScan scan_tag(std::string_view s, std::size_t i) {
  TagScan t;
  while (i < s.size()) {
    while (i < s.size() && is_space(s[i])) ++i;
    if (i >= s.size()) break;
    if (s[i] == '>') { t.complete = true; t.end = i + 1; return t; }
    if (s[i] == '/') {
      ++i;
      if (i < s.size() && s[i] == '>') { t.complete = true; t.self_closing = true; t.end = i + 1; return t; }
      continue;
    }
    std::string name;
    while (i < s.size() && !is_space(s[i]) && s[i] != '=' && s[i] != '>' && s[i] != '/') {
      name += lower(s[i]);
      ++i;
    }
    while (i < s.size() && is_space(s[i])) ++i;
    std::string value;
    if (i < s.size() && s[i] == '=') {
      ++i;
      while (i < s.size() && is_space(s[i])) ++i;
      if (i < s.size() && (s[i] == '"' || s[i] == '\'')) {
        const char quote = s[i++];
        while (i < s.size() && s[i] != quote) value += s[i++];
        if (i < s.size()) ++i;
      } else {
        while (i < s.size() && !is_space(s[i]) && s[i] != '>') value += s[i++];
      }
    }
    if (name == "id") t.id = value;
  }
  t.end = s.size();
  return t;
}

}  // namespace

ScriptLocation locate_manifest_script(std::string_view document) {
  ScriptLocation loc;
  std::size_t pos = 0;
  while ((pos = ifind(document, "<script", pos)) != std::string_view::npos) {
    const std::size_t after_name = pos + 7;
    // "<scripts" or "<script-foo" is a different element.
    if (after_name < document.size() && !is_space(document[after_name]) &&
        document[after_name] != '>' && document[after_name] != '/') {
      pos = after_name;
      continue;
    }
    const TagScan tag = scan_tag(document, after_name);
    if (tag.id != kManifestScriptId) {
      if (!tag.complete) return loc;
      pos = tag.end;
      continue;
    }
    loc.tag_begin = pos;
    if (!tag.complete || tag.self_closing) {
      loc.result = ScanResult::unterminated;
      return loc;
    }
    loc.content_begin = tag.end;
    const std::size_t close = ifind(document, "</script", loc.content_begin);
    if (close == std::string_view::npos) {
      loc.result = ScanResult::unterminated;
      return loc;
    }
    loc.content_end = close;
    const std::size_t gt = document.find('>', close);
    loc.block_end = (gt == std::string_view::npos) ? document.size() : gt + 1;
    loc.result = ScanResult::found;
    return loc;
  }
  return loc;
}

SignedEnvelope sign_manifest(const ManifestData& manifest, const Bytes& signing_key,
                             const SignatureScheme& scheme, std::optional<Error>* error) {
  SignedEnvelope env;
  std::optional<Error> err;
  const std::string message = canonical_encode(manifest);
  Bytes signature = scheme.sign(message, signing_key, &err);
  if (!err) {
    Bytes public_key = scheme.public_key_of(signing_key, &err);
    if (!err) {
      env.manifest   = manifest;
      env.signature  = std::move(signature);
      env.public_key = std::move(public_key);
    }
  }
  if (error) *error = err;
  return env;
}

std::string envelope_to_json(const SignedEnvelope& envelope) {
  jsonlite::Object obj;
  obj["manifest"]   = jsonlite::Value{manifest_to_object(envelope.manifest)};
  obj["signature"]  = jsonlite::Value{base64_encode(envelope.signature)};
  obj["public_key"] = jsonlite::Value{base64_encode(envelope.public_key)};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

std::string render_script_block(const SignedEnvelope& envelope) {
  const std::string json = envelope_to_json(envelope);
  std::string safe;
  safe.reserve(json.size() + 8);
  for (std::size_t i = 0; i < json.size(); ++i) {
    safe += json[i];
    if (json[i] == '<' && i + 1 < json.size() && json[i + 1] == '/') safe += '\\';
  }
  return std::string("<script type=\"application/json\" id=\"") + kManifestScriptId + "\">" +
         safe + "</script>";
}

std::string embed_envelope(const std::string& document, const SignedEnvelope& envelope) {
  const std::string block = render_script_block(envelope);

  const ScriptLocation existing = locate_manifest_script(document);
  if (existing.result == ScanResult::found) {
    return document.substr(0, existing.tag_begin) + block + document.substr(existing.block_end);
  }

  const std::size_t body_close = irfind(document, "</body>");
  if (body_close != std::string_view::npos) {
    return document.substr(0, body_close) + block + "\n" + document.substr(body_close);
  }
  std::string out = document;
  if (!out.empty() && out.back() != '\n') out += '\n';
  out += block;
  out += '\n';
  return out;
}

}  // namespace quill
