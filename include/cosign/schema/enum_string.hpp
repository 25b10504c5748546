#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace cosign::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace cosign::schema
