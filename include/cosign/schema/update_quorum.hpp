#pragma once

#include <cosign/schema/primitives.hpp>

// Schema type: update quorum.
// Replaces the number of signatures required to authorize any action,
// including the next quorum change.
namespace cosign::schema {

template <uint16_t Version>
struct update_quorum;

template <>
struct update_quorum<1> final {
  uint16_t version{1};
  uint64_t quorum{};
};

using update_quorum_t = update_quorum<1>;

}  // namespace cosign::schema
