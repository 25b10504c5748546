#pragma once
#include <blake3.h>
#include <cosign/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace cosign::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte outputs.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  /// Output of everything absorbed so far. The hasher stays usable.
  cosign::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

cosign::schema::hash32_t hash(const std::string_view& str);
cosign::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace cosign::blake3
