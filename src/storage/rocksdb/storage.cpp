#include <credo/storage/rocksdb/storage.hpp>

namespace credo::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  detail::require_ok(
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database),
      "failed to open RocksDB at " + std::string{path});
  spdlog::info("Opened registry store at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  return store;
}

}  // namespace credo::storage
