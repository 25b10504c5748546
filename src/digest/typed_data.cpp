#include <cosign/blake3/hash.hpp>
#include <cosign/digest/builder.hpp>
#include <cosign/digest/typed_data.hpp>

using namespace cosign::schema;

namespace cosign::digest {

hash32_t type_hash(const std::string_view type) {
  return cosign::blake3::hash(type);
}

hash32_t type_hash(const action_kind kind) {
  switch (kind) {
    case action_kind::execute:
      return type_hash(kExecuteType);
    case action_kind::update_quorum:
      return type_hash(kUpdateQuorumType);
    case action_kind::update_signer:
      return type_hash(kUpdateSignerType);
  }
  return type_hash(kExecuteType);
}

hash32_t domain_separator(const domain_t& domain) {
  auto b = builder{};
  b.word(type_hash(kDomainType))
      .hash(std::string_view{domain.name})
      .word(domain.chain_id)
      .word(domain.verifying_module);
  return b.finalize();
}

hash32_t struct_hash(const action_t& action, const uint64_t nonce) {
  auto b = builder{};
  b.word(type_hash(kind_of(action)));
  std::visit(overloaded{[&](const execute_t& value) {
                          b.word(value.target)
                              .word(value.value)
                              .hash(std::span(value.payload.data(),
                                              value.payload.size()));
                        },
                        [&](const update_quorum_t& value) {
                          b.word(value.quorum);
                        },
                        [&](const update_signer_t& value) {
                          b.word(value.signer).word(value.trust);
                        }},
             action);
  b.word(nonce);
  return b.finalize();
}

hash32_t build_digest(const hash32_t& domain_separator,
                      const hash32_t& struct_hash) {
  auto b = builder{};
  b.write(std::string_view{"\x19\x01", 2})
      .word(domain_separator)
      .word(struct_hash);
  return b.finalize();
}

hash32_t build_digest(const hash32_t& domain_separator,
                      const action_t& action,
                      const uint64_t nonce) {
  return build_digest(domain_separator, struct_hash(action, nonce));
}

}  // namespace cosign::digest
