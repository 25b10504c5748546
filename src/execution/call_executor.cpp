#include <cosign/execution/call_executor.hpp>

#include <spdlog/spdlog.h>

#include <sys/wait.h>
#include <array>
#include <cstdio>
#include <utility>

using namespace cosign::schema;

namespace {

std::string shell_quote(const std::string_view& argument) {
  auto quoted = std::string{"'"};
  for (const auto c : argument) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

}  // namespace

namespace cosign::execution {

call_executor_t make_rejecting_executor() {
  return [](const address_t& target, const amount_t&, const bytes_view_t&) {
    spdlog::warn("No call executor installed; rejecting call to 0x{}",
                 to_hex(target));
    return false;
  };
}

call_executor_t make_command_executor(std::string command) {
  return [command = std::move(command)](const address_t& target,
                                        const amount_t& value,
                                        const bytes_view_t& payload) {
    auto line = command;
    line += " " + shell_quote("0x" + to_hex(target));
    line += " " + shell_quote(cosign::schema::to_string(value));
    line += " " + shell_quote("0x" + to_hex(payload));

    spdlog::debug("Dispatching call: {}", line);
    auto* pipe = ::popen(line.c_str(), "r");
    if (pipe == nullptr) {
      spdlog::error("Failed to start call executor '{}'", command);
      return false;
    }
    auto buffer = std::array<char, 256>{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
           nullptr) {
      spdlog::debug("[{}] {}", command, buffer.data());
    }
    auto status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status)) {
      spdlog::warn("Call executor '{}' terminated abnormally", command);
      return false;
    }
    if (WEXITSTATUS(status) != 0) {
      spdlog::info("Call to 0x{} failed with exit status {}", to_hex(target),
                   WEXITSTATUS(status));
      return false;
    }
    return true;
  };
}

}  // namespace cosign::execution
