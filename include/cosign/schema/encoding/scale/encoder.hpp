#pragma once
#include <cosign/common/critical.hpp>
#include <cosign/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace cosign::schema::encoding {

struct scale_encoder_tag {};

/// SCALE (qdrvm scale-codec). Integers are fixed-width little-endian, bools
/// one byte, fixed arrays raw, and strings and vectors carry a compact length
/// prefix. Tuples encode field by field, which is how persisted rows are
/// shaped (see scale/transaction_event.hpp).
template <>
struct encoder<scale_encoder_tag> final {
  /// Encoding only fails on a codec bug, which is fatal.
  template <typename T>
  cosign::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const cosign::schema::bytes_view_t& bytes);
};

template <typename T>
cosign::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    cosign::common::critical("SCALE encoding failed: {}",
                             encoded.error().message());
  }
  return std::move(encoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const cosign::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("Rejected {} byte(s) of SCALE input: {}", bytes.size(),
                  decoded.error().message());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace cosign::schema::encoding
