#pragma once

#include <cosign/schema/primitives.hpp>
#include <functional>
#include <string>

namespace cosign::execution {

/// Forwards an authorized call to `target`. Returns false when the target
/// call failed; the engine then rolls back the whole action.
using call_executor_t =
    std::function<bool(const cosign::schema::address_t& target,
                       const cosign::schema::amount_t& value,
                       const cosign::schema::bytes_view_t& payload)>;

/// Executor installed when the host wires nothing: every call fails.
call_executor_t make_rejecting_executor();

/// Runs `command 0x<target> <value> 0x<payload>` through the shell and
/// reports success when it exits with status 0.
call_executor_t make_command_executor(std::string command);

}  // namespace cosign::execution
