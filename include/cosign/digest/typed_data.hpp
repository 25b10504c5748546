#pragma once
#include <cosign/schema/action.hpp>
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Structured-data digests signed by the trusted signer set.
//
// digest = BLAKE3(0x19 || 0x01 || domain_separator || struct_hash)
//
// Off-platform signers must reproduce this byte-for-byte, including the
// nonce they observed on the module before signing.
namespace cosign::digest {

inline constexpr std::string_view kDomainType{
    "CosignDomain(string name,uint256 chainId,address verifyingContract)"};
inline constexpr std::string_view kExecuteType{
    "Execute(address target,uint256 value,bytes data,uint256 nonce)"};
inline constexpr std::string_view kUpdateQuorumType{
    "UpdateQuorum(uint256 quorum,uint256 nonce)"};
inline constexpr std::string_view kUpdateSignerType{
    "UpdateSigner(address signer,bool trust,uint256 nonce)"};

/// Identifies one deployment of the module.
struct domain_t final {
  std::string name;
  uint64_t chain_id{};
  cosign::schema::address_t verifying_module{};
};

cosign::schema::hash32_t type_hash(std::string_view type);
cosign::schema::hash32_t type_hash(cosign::schema::action_kind kind);

cosign::schema::hash32_t domain_separator(const domain_t& domain);

/// Hash of the action's type constant, its fields and `nonce`.
cosign::schema::hash32_t struct_hash(const cosign::schema::action_t& action,
                                     uint64_t nonce);

cosign::schema::hash32_t build_digest(
    const cosign::schema::hash32_t& domain_separator,
    const cosign::schema::hash32_t& struct_hash);

cosign::schema::hash32_t build_digest(
    const cosign::schema::hash32_t& domain_separator,
    const cosign::schema::action_t& action,
    uint64_t nonce);

}  // namespace cosign::digest
