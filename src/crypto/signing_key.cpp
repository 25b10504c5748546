#include <cosign/common/critical.hpp>
#include <cosign/crypto/detail/secp256k1.hpp>
#include <cosign/crypto/signing_key.hpp>

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <utility>

namespace cosign::crypto {

signing_key::signing_key(const cosign::schema::hash32_t& secret,
                         const public_key_t& public_key)
    : secret_{secret},
      public_key_{public_key},
      address_{address_of(public_key)} {}

signing_key signing_key::generate() {
  for (auto attempt = 0; attempt < 16; ++attempt) {
    auto secret = cosign::schema::hash32_t{};
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
      cosign::common::critical("RAND_bytes failed while generating a key");
    }
    if (auto key = from_private_key(secret)) {
      return std::move(*key);
    }
  }
  cosign::common::critical("unable to generate a secp256k1 signing key");
}

std::optional<signing_key> signing_key::from_private_key(
    const cosign::schema::hash32_t& secret) {
  if (secp256k1_ec_seckey_verify(detail::context(), secret.data()) != 1) {
    return std::nullopt;
  }
  auto public_key = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(detail::context(), &public_key,
                                 secret.data()) != 1) {
    return std::nullopt;
  }
  auto encoded = detail::serialize_public_key(public_key);
  if (!encoded) {
    return std::nullopt;
  }
  return signing_key{secret, *encoded};
}

cosign::schema::signature_t signing_key::sign(
    const cosign::schema::hash32_t& digest) const {
  // RFC 6979 nonces; the library always produces low-s signatures.
  auto recoverable = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(detail::context(), &recoverable,
                                       digest.data(), secret_.data(),
                                       secp256k1_nonce_function_rfc6979,
                                       nullptr) != 1) {
    cosign::common::critical("failed to produce secp256k1 signature");
  }

  auto compact = std::array<uint8_t, 64>{};
  auto recovery_id = 0;
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          detail::context(), compact.data(), &recovery_id, &recoverable) !=
      1) {
    cosign::common::critical("failed to encode secp256k1 signature");
  }

  auto signature = cosign::schema::signature_t{};
  std::copy_n(std::begin(compact), signature.r.size(), std::begin(signature.r));
  std::copy_n(std::begin(compact) + signature.r.size(), signature.s.size(),
              std::begin(signature.s));
  signature.v = static_cast<uint8_t>(27 + recovery_id);
  return signature;
}

}  // namespace cosign::crypto
