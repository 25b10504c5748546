#pragma once

#include <cosign/crypto/recover.hpp>
#include <cosign/schema/primitives.hpp>

#include <optional>

namespace cosign::crypto {

/// secp256k1 private key held by an off-platform signer.
///
/// Signs 32-byte digests as-is (no further hashing) and emits low-s
/// signatures with a 27/28 recovery id.
class signing_key final {
 public:
  static signing_key generate();
  static std::optional<signing_key> from_private_key(
      const cosign::schema::hash32_t& secret);

  const cosign::schema::hash32_t& private_key() const { return secret_; }
  const public_key_t& public_key() const { return public_key_; }
  const cosign::schema::address_t& address() const { return address_; }

  cosign::schema::signature_t sign(
      const cosign::schema::hash32_t& digest) const;

 private:
  signing_key(const cosign::schema::hash32_t& secret,
              const public_key_t& public_key);

  cosign::schema::hash32_t secret_;
  public_key_t public_key_;
  cosign::schema::address_t address_;
};

}  // namespace cosign::crypto
