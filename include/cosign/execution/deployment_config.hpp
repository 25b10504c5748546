#pragma once

#include <cosign/digest/typed_data.hpp>
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace cosign::execution {

/// Construction-time parameters of one deployment.
///
/// `signers` and `quorum` only seed an empty store; a store that already
/// holds state keeps its own.
struct deployment_config final {
  cosign::digest::domain_t domain;
  std::vector<cosign::schema::address_t> signers;
  uint64_t quorum{};
};

}  // namespace cosign::execution
