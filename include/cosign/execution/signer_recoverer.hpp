#pragma once

#include <cosign/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace cosign::execution {

/// Maps a signature over `digest` to the identity that produced it, or
/// std::nullopt when the signature is unusable.
using signer_recoverer_t = std::function<std::optional<
    cosign::schema::address_t>(const cosign::schema::hash32_t& digest,
                               const cosign::schema::signature_t& signature)>;

/// secp256k1 recovery backed by cosign::crypto.
signer_recoverer_t make_default_signer_recoverer();

}  // namespace cosign::execution
