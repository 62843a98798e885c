#pragma once

// quill/envelope.hpp: Signed envelope construction and document embedding.
//
// ENVELOPE (compact JSON, sorted keys):
//   {"manifest":{"ai_percentage":..,"cited_percentage":..,"events":[..],
//                "human_percentage":..,"total_characters":..},
//    "public_key":"<base64>","signature":"<base64>"}
//
// EMBEDDING:
//   <script type="application/json" id="quill-manifest">ENVELOPE</script>
//   Inserted before the last </body>, or appended when the document has none.
//   An existing quill-manifest block is replaced, never duplicated.
//   "</" inside the JSON is written as "<\/" so a source string cannot close
//   the script element early.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "quill/signature.hpp"
#include "quill/types.hpp"

namespace quill {

inline constexpr char kManifestScriptId[] = "quill-manifest";

// canonical_encode() -> scheme.sign() -> {manifest, signature, public_key}.
SignedEnvelope sign_manifest(const ManifestData& manifest, const Bytes& signing_key,
                             const SignatureScheme& scheme, std::optional<Error>* error);

std::string envelope_to_json(const SignedEnvelope& envelope);

// The full <script ...>...</script> element.
std::string render_script_block(const SignedEnvelope& envelope);

std::string embed_envelope(const std::string& document, const SignedEnvelope& envelope);

// ---------------------------------------------------------------------------
// Script element scan, shared by the embedder and the verifier.
// Tolerates attribute order, single/double/no quotes, tag and attribute name
// case, and arbitrary whitespace inside the tag.
// ---------------------------------------------------------------------------
enum class ScanResult { found, absent, unterminated };

struct ScriptLocation {
  ScanResult  result{ScanResult::absent};
  std::size_t tag_begin{0};      // '<' of <script
  std::size_t content_begin{0};  // first byte after '>'
  std::size_t content_end{0};    // '<' of </script
  std::size_t block_end{0};      // one past the closing '>'
};

ScriptLocation locate_manifest_script(std::string_view document);

}  // namespace quill
