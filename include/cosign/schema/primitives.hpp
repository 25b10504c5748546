#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cosign::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using word_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;

/// Signer and call-target identity: the low 20 bytes of the BLAKE3 hash of
/// an uncompressed secp256k1 public key (without the 0x04 prefix).
///
/// std::array compares lexicographically, which matches the big-endian
/// numeric ordering signatures must be submitted in.
using address_t = std::array<uint8_t, 20>;

/// Recoverable secp256k1 signature.
///
/// `v` is the recovery id in either the 27/28 or the 0/1 convention.
struct signature_t final {
  uint8_t v{};
  hash32_t r{};
  hash32_t s{};

  bool operator==(const signature_t&) const = default;
};

inline constexpr std::size_t kSignatureWireSize = 65;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();

/// Decimal rendering of an amount, e.g. "1000000000000000000".
std::string to_string(const amount_t& amount);
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

/// Parse the 65-byte `r || s || v` wire form.
std::optional<signature_t> make_signature(const bytes_view_t& bytes);
bytes_t to_bytes(const signature_t& signature);

}  // namespace cosign::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
