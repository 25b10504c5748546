#pragma once

#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <set>

namespace cosign::execution {

/// Mutable state of one deployment: the trusted signer set, the quorum and
/// the replay-protection nonce.
///
/// The engine applies every action to a copy and swaps it in only once the
/// action has been verified, executed and persisted.
struct module_state final {
  std::set<cosign::schema::address_t> trusted;
  uint64_t quorum{};
  uint64_t nonce{1};

  bool is_trusted(const cosign::schema::address_t& signer) const;

  /// Returns true when the membership actually changed.
  bool set_trust(const cosign::schema::address_t& signer, bool trust);

  /// Returns the nonce the next digest binds to and advances the counter.
  uint64_t use_nonce();
};

}  // namespace cosign::execution
