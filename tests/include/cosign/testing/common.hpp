#pragma once

#include <cosign/crypto/signing_key.hpp>
#include <cosign/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cosign::testing {

inline cosign::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = cosign::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline cosign::schema::address_t make_address(const uint8_t seed) {
  auto address = cosign::schema::address_t{};
  address.fill(seed);
  return address;
}

/// Deterministic keys, sorted ascending by address.
inline std::vector<cosign::crypto::signing_key> make_signing_keys(
    const std::size_t count) {
  auto keys = std::vector<cosign::crypto::signing_key>{};
  keys.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    auto key = cosign::crypto::signing_key::from_private_key(
        make_hash(static_cast<uint8_t>(0x10 + (i * 0x20))));
    keys.push_back(std::move(key.value()));
  }
  std::sort(std::begin(keys), std::end(keys),
            [](const auto& lhs, const auto& rhs) {
              return lhs.address() < rhs.address();
            });
  return keys;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace cosign::testing
