#pragma once
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace cosign::digest {

/// Accumulates 32-byte words for structured-data hashing.
///
/// Unsigned integers are written big-endian and left padded, addresses are
/// left padded with 12 zero bytes, booleans occupy the last byte of a word
/// and dynamic data is represented by its BLAKE3 hash.
struct builder final {
  cosign::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& word(const cosign::schema::word_t& value);
  builder& word(const cosign::schema::address_t& value);
  builder& word(const cosign::schema::amount_t& value);
  builder& word(bool value);

  template <typename T,
            typename = std::enable_if_t<std::is_unsigned_v<T> &&
                                        !std::is_same_v<T, bool>>>
  builder& word(T value) {
    auto out = cosign::schema::word_t{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      out[out.size() - 1 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return word(out);
  }

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  /// BLAKE3 of everything written so far.
  cosign::schema::hash32_t finalize() const;
};

}  // namespace cosign::digest
