#pragma once

#include <cstdint>
#include <string_view>

namespace cosign::schema {

enum class transaction_error_code : uint32_t {
  invalid_signatures = 1,
  execution_failed = 2,
  signature_index_out_of_range = 3,
  // Submitted from inside the call executor of another action.
  reentrant_call = 4,
};

std::string_view to_string(transaction_error_code code);

}  // namespace cosign::schema
