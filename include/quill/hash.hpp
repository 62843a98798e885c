#pragma once

#include <string>
#include <string_view>

namespace quill {

// Core BLAKE3 hashing (32-byte output).
std::string blake3_hex(std::string_view payload);

// Domain-separated hashing: BLAKE3(domain || payload), hex-encoded.
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest of attributed text as stored in the ledger ("txt:" domain).
// The ledger never stores plain text, only this value.
std::string content_digest(std::string_view text);

// True if s is exactly 64 lowercase hex characters.
bool is_hex_digest(std::string_view s);

std::string blake3_library_version();

}  // namespace quill
