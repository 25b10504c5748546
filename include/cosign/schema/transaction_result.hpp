#pragma once

#include <cosign/schema/primitives.hpp>
#include <cosign/schema/transaction_error_code.hpp>
#include <cosign/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace cosign::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
};

using transaction_result_t = transaction_result<1>;

transaction_result_t make_error_result(transaction_error_code code,
                                       std::string_view codespace,
                                       std::string info);

}  // namespace cosign::schema
