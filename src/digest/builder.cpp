#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <cosign/blake3/hash.hpp>
#include <cosign/digest/builder.hpp>
#include <iterator>
#include <ranges>

using namespace cosign::digest;
using namespace cosign::schema;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::word(const word_t& value) {
  return write(std::span(value.data(), value.size()));
}

builder& builder::word(const address_t& value) {
  auto out = word_t{};
  std::ranges::copy(value, std::begin(out) + (out.size() - value.size()));
  return word(out);
}

builder& builder::word(const amount_t& value) {
  auto be = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(be), 8);
  auto out = word_t{};
  std::ranges::copy(be, std::begin(out) + (out.size() - be.size()));
  return word(out);
}

builder& builder::word(const bool value) {
  auto out = word_t{};
  out.back() = value ? 1 : 0;
  return word(out);
}

builder& builder::hash(const std::string_view& str) {
  return word(cosign::blake3::hash(str));
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  return word(cosign::blake3::hash(bytes));
}

hash32_t builder::finalize() const {
  return cosign::blake3::hash(std::span(data.data(), data.size()));
}
