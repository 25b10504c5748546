#pragma once
#include <cosign/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace cosign::storage {

using key_value_entry_t =
    std::pair<cosign::schema::bytes_t, cosign::schema::bytes_t>;

/// Ordered key-value store holding the module state and its event log.
///
/// Writes go through `commit` only, so every state transition lands in one
/// atomic batch.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cosign::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const cosign::schema::bytes_view_t& prefix) const;

  /// Return key-value pairs with `first <= key <= last`, in key order.
  std::vector<key_value_entry_t> list_range(
      const cosign::schema::bytes_view_t& first,
      const cosign::schema::bytes_view_t& last) const;

  /// Atomically write every entry; either all become visible or none do.
  void commit(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cosign::storage
