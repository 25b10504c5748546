#pragma once

#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes for the module state (domain, quorum, nonce,
// signer registry) and the append-only event log.
namespace cosign::schema::key {

inline constexpr std::string_view kDomainKey{"SYS|STATE|DOMAIN"};
inline constexpr std::string_view kQuorumKey{"SYS|STATE|QUORUM"};
inline constexpr std::string_view kNonceKey{"SYS|STATE|NONCE"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
inline constexpr std::string_view kSignerKeyPrefix{"SYS|STATE|SIGNER|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

cosign::schema::bytes_t make_key(std::string_view name);

cosign::schema::bytes_t make_signer_key(
    const cosign::schema::address_t& signer);
std::optional<cosign::schema::address_t> parse_signer_key(
    const cosign::schema::bytes_view_t& key);

/// Event keys carry the sequence big-endian so iteration order is
/// emission order.
cosign::schema::bytes_t make_event_key(uint64_t sequence);

}  // namespace cosign::schema::key
