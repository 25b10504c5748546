#include <cosign/schema/enum_string.hpp>
#include <cosign/schema/transaction_result.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace cosign::schema {

namespace {

inline constexpr enum_names_t<transaction_error_code, 4> kErrorCodeNames{{
    {"invalid signatures", transaction_error_code::invalid_signatures},
    {"execution failed", transaction_error_code::execution_failed},
    {"signature index out of range",
     transaction_error_code::signature_index_out_of_range},
    {"reentrant call", transaction_error_code::reentrant_call},
}};

}  // namespace

std::string_view to_string(const transaction_error_code code) {
  return to_string(code, kErrorCodeNames).value_or("unknown error");
}

std::optional<std::string> find_attribute(const transaction_event_t& event,
                                          const std::string_view key) {
  auto found = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const transaction_event_attribute_t& attribute) {
        return attribute.key == key;
      });
  if (found == std::end(event.attributes)) {
    return std::nullopt;
  }
  return found->value;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace cosign::schema
