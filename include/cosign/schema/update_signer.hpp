#pragma once

#include <cosign/schema/primitives.hpp>

// Schema type: update signer.
// Adds (`trust == true`) or removes an identity from the trusted signer set.
namespace cosign::schema {

template <uint16_t Version>
struct update_signer;

template <>
struct update_signer<1> final {
  uint16_t version{1};
  address_t signer{};
  bool trust{true};
};

using update_signer_t = update_signer<1>;

}  // namespace cosign::schema
