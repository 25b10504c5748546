#pragma once

#include <cosign/crypto/recover.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <optional>

namespace cosign::crypto::detail {

/// Process-wide signing and verification context. Read-only after creation,
/// so it is shared across threads.
const secp256k1_context* context();

/// Uncompressed encoding of `public_key` with the 0x04 prefix stripped.
std::optional<public_key_t> serialize_public_key(
    const secp256k1_pubkey& public_key);

}  // namespace cosign::crypto::detail
