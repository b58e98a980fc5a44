#include <bootforge/common/critical.hpp>
#include <bootforge/storage/rocksdb/storage.hpp>

#include <filesystem>

namespace bootforge::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // RocksDB creates the database directory but not its parents.
  auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto ec = std::error_code{};
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      bootforge::common::critical("cannot create {}: {}", parent.string(),
                                  ec.message());
    }
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // The ledger holds a handful of small records.
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    bootforge::common::critical("failed to open RocksDB at {}: {}", path,
                                status.ToString());
  }
  spdlog::debug("opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace bootforge::storage
