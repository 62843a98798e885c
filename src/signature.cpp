#include "quill/signature.hpp"

#include "quill/observability.hpp"

#include <memory>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace quill {

namespace {

using EvpPkeyPtr  = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void set_error(std::optional<Error>* error, ErrorCode code, std::string message) {
  if (error) *error = Error{code, std::move(message)};
}

EvpPkeyPtr private_key_from_seed(const Bytes& seed) {
  return EvpPkeyPtr(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                 seed.data(), seed.size()),
                    &EVP_PKEY_free);
}

Bytes raw_public_key(EVP_PKEY* pkey) {
  Bytes out(kVerifyingKeyBytes);
  size_t len = out.size();
  if (EVP_PKEY_get_raw_public_key(pkey, out.data(), &len) != 1 ||
      len != kVerifyingKeyBytes) {
    return {};
  }
  return out;
}

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

KeyPair Ed25519Scheme::generate_keypair(std::optional<Error>* error) const {
  if (error) error->reset();
  KeyPair kp;
  Bytes seed(kSigningKeyBytes);
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    set_error(error, ErrorCode::rng_failure, "CSPRNG could not produce key material");
    return kp;
  }
  auto pub = public_key_of(seed, error);
  if (pub.empty()) return kp;
  kp.signing_key   = std::move(seed);
  kp.verifying_key = std::move(pub);
  return kp;
}

Bytes Ed25519Scheme::public_key_of(const Bytes& signing_key,
                                   std::optional<Error>* error) const {
  if (error) error->reset();
  if (signing_key.size() != kSigningKeyBytes) {
    set_error(error, ErrorCode::invalid_key_length,
              "signing key must be " + std::to_string(kSigningKeyBytes) + " bytes, got " +
                  std::to_string(signing_key.size()));
    return {};
  }
  auto pkey = private_key_from_seed(signing_key);
  if (!pkey) {
    set_error(error, ErrorCode::invalid_input, "signing key rejected by ed25519");
    return {};
  }
  auto pub = raw_public_key(pkey.get());
  if (pub.empty()) set_error(error, ErrorCode::invalid_input, "could not derive public key");
  return pub;
}

Bytes Ed25519Scheme::sign(std::string_view message, const Bytes& signing_key,
                          std::optional<Error>* error) const {
  uint64_t duration_ns = 0;
  Bytes signature;
  std::optional<Error> err;
  {
    ScopeTimer timer(duration_ns);
    if (message.empty()) {
      err = Error{ErrorCode::invalid_input, "content cannot be empty"};
    } else if (signing_key.size() != kSigningKeyBytes) {
      err = Error{ErrorCode::invalid_key_length,
                  "signing key must be " + std::to_string(kSigningKeyBytes) + " bytes, got " +
                      std::to_string(signing_key.size())};
    } else {
      auto pkey = private_key_from_seed(signing_key);
      EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      size_t sig_len = kSignatureBytes;
      signature.resize(kSignatureBytes);
      // Ed25519 is one-shot: EVP_DigestSign with a null digest, no streaming.
      if (!pkey || !ctx ||
          EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1 ||
          EVP_DigestSign(ctx.get(), signature.data(), &sig_len,
                         reinterpret_cast<const unsigned char*>(message.data()),
                         message.size()) != 1 ||
          sig_len != kSignatureBytes) {
        signature.clear();
        err = Error{ErrorCode::invalid_input, "ed25519 signing failed"};
      }
    }
  }

  OperationEvent ev;
  ev.operation   = "sign";
  ev.ok          = !err.has_value();
  ev.error_code  = err ? to_string(err->code) : "";
  ev.duration_ns = duration_ns;
  ev.detail      = "bytes=" + std::to_string(message.size());
  emit_operation_event(ev);

  if (error) *error = err;
  return signature;
}

bool Ed25519Scheme::verify(std::string_view message, const Bytes& signature,
                           const Bytes& verifying_key, std::optional<Error>* error) const {
  if (message.empty()) {
    set_error(error, ErrorCode::invalid_input, "content cannot be empty");
    return false;
  }
  if (verifying_key.size() != kVerifyingKeyBytes) {
    set_error(error, ErrorCode::invalid_key_length,
              "public key must be " + std::to_string(kVerifyingKeyBytes) + " bytes, got " +
                  std::to_string(verifying_key.size()));
    return false;
  }
  if (signature.size() != kSignatureBytes) {
    set_error(error, ErrorCode::invalid_signature_length,
              "signature must be " + std::to_string(kSignatureBytes) + " bytes, got " +
                  std::to_string(signature.size()));
    return false;
  }
  if (error) error->reset();

  EvpPkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                              verifying_key.data(), verifying_key.size()),
                  &EVP_PKEY_free);
  // A 32-byte value that is not a curve point cannot have signed anything.
  if (!pkey) return false;

  EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          reinterpret_cast<const unsigned char*>(message.data()),
                          message.size()) == 1;
}

const SignatureScheme& ed25519() {
  static const Ed25519Scheme inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Base64
// ---------------------------------------------------------------------------

std::string base64_encode(const Bytes& data) {
  if (data.empty()) return {};
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                data.data(), static_cast<int>(data.size()));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

Bytes base64_decode(std::string_view text, std::optional<Error>* error) {
  if (error) error->reset();
  if (text.empty()) return {};
  if (text.size() % 4 != 0) {
    set_error(error, ErrorCode::invalid_encoding, "base64 length is not a multiple of 4");
    return {};
  }
  size_t padding = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '=') {
      // Padding only in the last two positions, and only as a suffix.
      if (i < text.size() - 2) {
        set_error(error, ErrorCode::invalid_encoding, "misplaced base64 padding");
        return {};
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      set_error(error, ErrorCode::invalid_encoding, "invalid base64 character");
      return {};
    }
  }

  Bytes out(3 * (text.size() / 4));
  const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (n < 0 || static_cast<size_t>(n) < padding) {
    set_error(error, ErrorCode::invalid_encoding, "invalid base64");
    return {};
  }
  // EVP_DecodeBlock counts padding as zero bytes.
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

}  // namespace quill
