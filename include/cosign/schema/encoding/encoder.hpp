#pragma once
#include <cosign/schema/primitives.hpp>
#include <optional>

namespace cosign::schema::encoding {

/// Value codec used for everything persisted by the storage layer.
///
/// The codec is a build time choice made by specializing on a library tag;
/// digests never go through it (see cosign::digest). Values are written
/// once and read back, so the interface is encode plus a decode that reports
/// malformed bytes instead of failing.
template <typename Library>
struct encoder {
  template <typename T>
  cosign::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const cosign::schema::bytes_view_t& bytes);
};

}  // namespace cosign::schema::encoding
