#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace cosign::common {

/// Log at critical level, flush every sink and terminate the process.
///
/// Reserved for failures the module cannot roll back from (storage, a store
/// that belongs to another deployment, unusable command line input).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Arg>(arg),
                                        std::forward<Args>(args)...)});
}

}  // namespace cosign::common
