#include <cosign/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>

namespace cosign::schema::key {

namespace {

bool has_prefix(const cosign::schema::bytes_view_t& key,
                const std::string_view prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                    [](const char lhs, const uint8_t rhs) {
                      return static_cast<uint8_t>(lhs) == rhs;
                    });
}

}  // namespace

cosign::schema::bytes_t make_key(const std::string_view name) {
  return cosign::schema::make_bytes(name);
}

cosign::schema::bytes_t make_signer_key(
    const cosign::schema::address_t& signer) {
  auto key = make_key(kSignerKeyPrefix);
  key.insert(std::end(key), std::begin(signer), std::end(signer));
  return key;
}

std::optional<cosign::schema::address_t> parse_signer_key(
    const cosign::schema::bytes_view_t& key) {
  auto signer = cosign::schema::address_t{};
  if (!has_prefix(key, kSignerKeyPrefix) ||
      key.size() != kSignerKeyPrefix.size() + signer.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + kSignerKeyPrefix.size(), std::end(key),
            std::begin(signer));
  return signer;
}

cosign::schema::bytes_t make_event_key(const uint64_t sequence) {
  auto key = make_key(kEventPrefix);
  for (auto shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<uint8_t>((sequence >> shift) & 0xFF));
  }
  return key;
}

}  // namespace cosign::schema::key
