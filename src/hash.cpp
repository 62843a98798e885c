#include "quill/hash.hpp"

// BLAKE3 is the sole hash primitive for content digests.
//
// DESIGN INVARIANTS:
//   1. Domain separation: the "txt:" prefix keeps content digests distinct from
//      any other use of BLAKE3 in the process. The prefix is part of the ledger
//      format; changing it changes every stored digest.
//   2. Digests are 32 bytes, rendered as 64 lowercase hex chars.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace quill {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string content_digest(std::string_view text) {
  return hash_domain("txt:", text);
}

bool is_hex_digest(std::string_view s) {
  if (s.size() != BLAKE3_OUT_LEN * 2) return false;
  for (char c : s) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) return false;
  }
  return true;
}

std::string blake3_library_version() {
  const char* v = blake3_version();
  return v ? v : "unknown";
}

}  // namespace quill
