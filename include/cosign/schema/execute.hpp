#pragma once

#include <cosign/schema/primitives.hpp>

// Schema type: execute.
// Forwards `value` and `payload` to `target` once a quorum has signed it.
namespace cosign::schema {

template <uint16_t Version>
struct execute;

template <>
struct execute<1> final {
  uint16_t version{1};
  address_t target{};
  amount_t value{};
  bytes_t payload;
};

using execute_t = execute<1>;

}  // namespace cosign::schema
