#pragma once

#include <cosign/execution/module_state.hpp>
#include <cosign/execution/signer_recoverer.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/transaction_error_code.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace cosign::execution {

struct verification_failure final {
  cosign::schema::transaction_error_code code{};
  std::size_t index{};
  cosign::schema::address_t signer{};
};

/// Check the first `state.quorum` entries of `signatures` against `digest`.
///
/// Recovered identities must be trusted and strictly ascending; entries past
/// the quorum are ignored. An unrecoverable signature counts as the zero
/// identity. Running out of signatures before the quorum is met reports
/// `signature_index_out_of_range` at the first missing index.
std::optional<verification_failure> verify_signatures(
    const module_state& state,
    const cosign::schema::hash32_t& digest,
    const std::vector<cosign::schema::signature_t>& signatures,
    const signer_recoverer_t& recoverer);

/// Sort `signatures` ascending by recovered identity, the order
/// verify_signatures expects. Unrecoverable signatures sort first.
std::vector<cosign::schema::signature_t> order_signatures(
    const cosign::schema::hash32_t& digest,
    std::vector<cosign::schema::signature_t> signatures,
    const signer_recoverer_t& recoverer);

}  // namespace cosign::execution
