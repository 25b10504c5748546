#include <cosign/common/critical.hpp>
#include <cosign/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>

namespace cosign::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    cosign::common::critical("invalid hex input");
  }
  return *decoded;
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    cosign::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    cosign::common::critical("expected 32 bytes of hex, got '{}'", hex);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address) {
    cosign::common::critical("expected 20 bytes of hex, got '{}'", hex);
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

address_t make_zero_address() {
  return {};
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

std::optional<amount_t> try_make_amount(const std::string_view& decimal) {
  auto all_digits = std::all_of(std::begin(decimal), std::end(decimal),
                                [](const char c) {
                                  return std::isdigit(
                                             static_cast<unsigned char>(c)) !=
                                         0;
                                });
  if (decimal.empty() || !all_digits) {
    return std::nullopt;
  }
  // Boost reads a leading 0 as an octal prefix.
  auto significant = decimal.find_first_not_of('0');
  if (significant == std::string_view::npos) {
    return amount_t{};
  }
  auto parsed = boost::multiprecision::cpp_int{
      std::string{decimal.substr(significant)}};
  if (parsed >
      boost::multiprecision::cpp_int{std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(parsed);
}

std::optional<signature_t> make_signature(const bytes_view_t& bytes) {
  if (bytes.size() != kSignatureWireSize) {
    return std::nullopt;
  }
  auto signature = signature_t{};
  std::copy_n(bytes.data(), signature.r.size(), signature.r.data());
  std::copy_n(bytes.data() + 32, signature.s.size(), signature.s.data());
  signature.v = bytes[64];
  return signature;
}

bytes_t to_bytes(const signature_t& signature) {
  auto out = bytes_t{};
  out.reserve(kSignatureWireSize);
  out.insert(std::end(out), std::begin(signature.r), std::end(signature.r));
  out.insert(std::end(out), std::begin(signature.s), std::end(signature.s));
  out.push_back(signature.v);
  return out;
}

}  // namespace cosign::schema
