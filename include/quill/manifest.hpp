#pragma once

// quill/manifest.hpp: Manifest builder and canonical encoder.
//
// CANONICAL ENCODING (version 1, see version::CANONICAL_ENCODING_VERSION):
//
//   {"ai_percentage":P,"cited_percentage":P,"human_percentage":P,"total_characters":U}
//
//   - Exactly these four keys, in this order, no whitespace.
//   - P = jsonlite::format_double(): printf "%.6f", trailing zeros trimmed,
//     at least one fractional digit. 60 -> "60.0", 100/3 -> "33.333333".
//   - U = unsigned decimal, no sign, no leading zeros.
//   - events are NOT encoded. The excerpt is advisory and unsigned.
//
// The signer and the verifier both call canonical_encode(). Any change to this
// function invalidates every signature ever produced; bump the encoding version
// instead of editing it in place.
//
// ZERO CORPUS:
//   A ledger with total_characters == 0 yields 0.0 / 0.0 / 0.0. Nothing was
//   attributed, so no share is claimed for any kind.

#include <cstddef>
#include <optional>
#include <string>

#include "quill/jsonlite.hpp"
#include "quill/ledger.hpp"
#include "quill/types.hpp"

namespace quill {

constexpr std::size_t kDefaultExcerptLimit = 50;

// Percentages from per-kind totals. Pure; no rounding.
ManifestData manifest_from_totals(const KindTotals& totals);

// aggregate() for the numbers, query(none, excerpt_limit) for the excerpt.
// Ledger errors are passed through unchanged.
ManifestData build_manifest(const LedgerBackend& ledger, std::size_t excerpt_limit,
                            std::optional<Error>* error);

std::string canonical_encode(const ManifestData& manifest);

// Full manifest object as embedded in the envelope (includes events).
jsonlite::Object manifest_to_object(const ManifestData& manifest);

}  // namespace quill
