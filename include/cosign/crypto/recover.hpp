#pragma once

#include <cosign/schema/primitives.hpp>

#include <array>
#include <optional>

namespace cosign::crypto {

using public_key_t = std::array<uint8_t, 64>;  // X || Y, no 0x04 prefix

/// Identity derived from an uncompressed secp256k1 public key.
cosign::schema::address_t address_of(const public_key_t& public_key);

/// Recover the public key that produced `signature` over the 32-byte
/// `digest`.
///
/// Returns std::nullopt for an unusable recovery id (anything but 0, 1, 27
/// or 28), `r`/`s` outside [1, n-1], or an `r` that is not the x coordinate
/// of a curve point.
std::optional<public_key_t> recover_public_key(
    const cosign::schema::hash32_t& digest,
    const cosign::schema::signature_t& signature);

std::optional<cosign::schema::address_t> recover_signer(
    const cosign::schema::hash32_t& digest,
    const cosign::schema::signature_t& signature);

}  // namespace cosign::crypto
