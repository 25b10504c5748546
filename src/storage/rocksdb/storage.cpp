#include <cosign/common/critical.hpp>
#include <cosign/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <string>

namespace cosign::storage {

namespace {

// The module writes a handful of small keys per action and fsyncs every
// batch, so the defaults only need a bounded info log and checksum checks.
ROCKSDB_NAMESPACE::Options make_module_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.OptimizeForSmallDb();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto location = std::string{path};
  auto error = std::error_code{};
  auto existed = std::filesystem::exists(location, error);
  if (existed && !std::filesystem::is_directory(location, error)) {
    cosign::common::critical("module store '{}' is not a directory", location);
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_module_options(), location, &database);
  if (!status.ok()) {
    cosign::common::critical("failed to open module store '{}': {}", location,
                             status.ToString());
  }
  spdlog::info("{} module store at {}", existed ? "Opened" : "Created",
               location);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace cosign::storage
