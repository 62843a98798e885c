#pragma once

// quill/signature.hpp: Identity & signing primitive.
//
// SignatureScheme is the seam between the manifest protocol and the asymmetric
// algorithm. Ed25519Scheme (OpenSSL EVP) is the only production implementation;
// tests substitute counting doubles to prove the verifier rejects malformed
// envelopes before any cryptographic call.
//
// CONTRACT:
//   verify(m, sign(m, sk), public_key_of(sk)) == true for every non-empty m.
//   A well-formed but wrong signature is a normal `false` result, never an error.
//   Errors are reserved for malformed inputs (wrong key/signature length, empty
//   message) and for CSPRNG failure during key generation.
//
// Thread-safety: implementations hold no mutable state. All OpenSSL contexts are
// created per call, so concurrent sign/verify from many threads is safe.

#include <optional>
#include <string>
#include <string_view>

#include "quill/types.hpp"

namespace quill {

class SignatureScheme {
 public:
  virtual ~SignatureScheme() = default;

  virtual std::string algorithm() const = 0;

  // Fresh keypair from the OS CSPRNG. RNG failure -> rng_failure (fatal).
  virtual KeyPair generate_keypair(std::optional<Error>* error) const = 0;

  // Recompute the verifying key for a signing key.
  virtual Bytes public_key_of(const Bytes& signing_key, std::optional<Error>* error) const = 0;

  virtual Bytes sign(std::string_view message, const Bytes& signing_key,
                     std::optional<Error>* error) const = 0;

  // Returns false for a non-matching signature. *error is set only for
  // malformed inputs, in which case the return value is false as well.
  virtual bool verify(std::string_view message, const Bytes& signature,
                      const Bytes& verifying_key, std::optional<Error>* error) const = 0;
};

class Ed25519Scheme : public SignatureScheme {
 public:
  std::string algorithm() const override { return "ed25519"; }
  KeyPair generate_keypair(std::optional<Error>* error) const override;
  Bytes public_key_of(const Bytes& signing_key, std::optional<Error>* error) const override;
  Bytes sign(std::string_view message, const Bytes& signing_key,
             std::optional<Error>* error) const override;
  bool verify(std::string_view message, const Bytes& signature,
              const Bytes& verifying_key, std::optional<Error>* error) const override;
};

// Process-wide stateless instance.
const SignatureScheme& ed25519();

// Standard alphabet, padded.
std::string base64_encode(const Bytes& data);

// Strict decode: rejects whitespace, bad characters, bad padding.
// Sets *error to invalid_encoding on failure.
Bytes base64_decode(std::string_view text, std::optional<Error>* error);

}  // namespace quill
