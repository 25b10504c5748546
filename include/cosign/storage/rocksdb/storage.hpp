#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cosign/common/critical.hpp>
#include <cosign/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace cosign::storage {

namespace detail {

inline cosign::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const cosign::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline bool slice_less_equal(const ROCKSDB_NAMESPACE::Slice& lhs,
                             const ROCKSDB_NAMESPACE::Slice& rhs) {
  return lhs.compare(rhs) <= 0;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cosign::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const cosign::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_range(
      const cosign::schema::bytes_view_t& first,
      const cosign::schema::bytes_view_t& last) const;
  void commit(const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const cosign::schema::bytes_view_t& key) const {
  if (!database) {
    cosign::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    cosign::common::critical("Failed to get value from RocksDB");
  }
  auto decoded = encoder.template try_decode<T>(cosign::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    cosign::common::critical("malformed value under key 0x{} in RocksDB",
                             cosign::schema::to_hex(key));
  }
  return decoded;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const cosign::schema::bytes_view_t& prefix) const {
  if (!database) {
    cosign::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(prefix_slice); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    cosign::common::critical("RocksDB prefix scan failed");
  }
  return entries;
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const cosign::schema::bytes_view_t& first,
    const cosign::schema::bytes_view_t& last) const {
  if (!database) {
    cosign::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto last_slice = detail::to_slice(last);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(first)); iterator->Valid();
       iterator->Next()) {
    if (!detail::slice_less_equal(iterator->key(), last_slice)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB range scan failed: {}",
                  iterator->status().ToString());
    cosign::common::critical("RocksDB range scan failed");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    cosign::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      cosign::common::critical("failed staging key in RocksDB write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB write batch: {}",
                  write_status.ToString());
    cosign::common::critical("failed to commit RocksDB write batch");
  }
}

}  // namespace cosign::storage
