#pragma once
#include <cosign/schema/enum_string.hpp>
#include <cosign/schema/execute.hpp>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/update_quorum.hpp>
#include <cosign/schema/update_signer.hpp>
#include <optional>
#include <string_view>
#include <variant>

namespace cosign::schema {

using action_t = std::variant<execute_t, update_quorum_t, update_signer_t>;

enum class action_kind : uint8_t { execute, update_quorum, update_signer };

/// Command line spelling of each action kind.
inline constexpr enum_names_t<action_kind, 3> kActionKindNames{{
    {"execute", action_kind::execute},
    {"set-quorum", action_kind::update_quorum},
    {"set-signer", action_kind::update_signer},
}};

action_kind kind_of(const action_t& action);
std::optional<action_kind> try_make_action_kind(std::string_view name);
std::string_view to_string(action_kind kind);

}  // namespace cosign::schema
