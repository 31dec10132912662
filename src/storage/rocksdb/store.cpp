#include <mnemo/common/critical.hpp>
#include <mnemo/storage/rocksdb/store.hpp>

namespace mnemo::storage {

template <>
store<rocksdb_store_tag> make_store<rocksdb_store_tag>(
    const std::string_view& path) {
  auto result = store<rocksdb_store_tag>{};

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    mnemo::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  result.database.reset(database);

  return result;
}

}  // namespace mnemo::storage
