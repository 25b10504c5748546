#include <cosign/crypto/recover.hpp>
#include <cosign/execution/signature_verifier.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace cosign::schema;

namespace cosign::execution {

signer_recoverer_t make_default_signer_recoverer() {
  return [](const hash32_t& digest, const signature_t& signature) {
    return cosign::crypto::recover_signer(digest, signature);
  };
}

std::optional<verification_failure> verify_signatures(
    const module_state& state,
    const hash32_t& digest,
    const std::vector<signature_t>& signatures,
    const signer_recoverer_t& recoverer) {
  auto previous = make_zero_address();
  for (uint64_t i = 0; i < state.quorum; ++i) {
    auto index = static_cast<std::size_t>(i);
    if (index >= signatures.size()) {
      spdlog::debug("Signature index {} out of range ({} supplied)", index,
                    signatures.size());
      return verification_failure{
          .code = transaction_error_code::signature_index_out_of_range,
          .index = index};
    }
    auto signer = recoverer(digest, signatures[index])
                      .value_or(make_zero_address());
    if (!state.is_trusted(signer) || signer <= previous) {
      spdlog::debug("Rejecting signature {} from 0x{}", index, to_hex(signer));
      return verification_failure{
          .code = transaction_error_code::invalid_signatures,
          .index = index,
          .signer = signer};
    }
    previous = signer;
  }
  return std::nullopt;
}

std::vector<signature_t> order_signatures(const hash32_t& digest,
                                          std::vector<signature_t> signatures,
                                          const signer_recoverer_t& recoverer) {
  auto keyed = std::vector<std::pair<address_t, signature_t>>{};
  keyed.reserve(signatures.size());
  for (auto& signature : signatures) {
    keyed.emplace_back(recoverer(digest, signature).value_or(make_zero_address()),
                       std::move(signature));
  }
  std::stable_sort(std::begin(keyed), std::end(keyed),
                   [](const auto& lhs, const auto& rhs) {
                     return lhs.first < rhs.first;
                   });
  auto ordered = std::vector<signature_t>{};
  ordered.reserve(keyed.size());
  for (auto& [signer, signature] : keyed) {
    ordered.push_back(std::move(signature));
  }
  return ordered;
}

}  // namespace cosign::execution
