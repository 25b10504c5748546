#include <cosign/schema/action.hpp>

namespace cosign::schema {

action_kind kind_of(const action_t& action) {
  return std::visit(
      overloaded{[](const execute_t&) { return action_kind::execute; },
                 [](const update_quorum_t&) {
                   return action_kind::update_quorum;
                 },
                 [](const update_signer_t&) {
                   return action_kind::update_signer;
                 }},
      action);
}

std::optional<action_kind> try_make_action_kind(const std::string_view name) {
  return from_string(name, kActionKindNames);
}

std::string_view to_string(const action_kind kind) {
  return to_string(kind, kActionKindNames).value_or("unknown");
}

}  // namespace cosign::schema
