#include <notary/common/critical.hpp>
#include <notary/storage/rocksdb/storage.hpp>

#include <memory>

namespace notary::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_registry_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Proof and nonce keys are point lookups only.
  options.OptimizeForSmallDb();
  options.IncreaseParallelism();
  options.keep_log_file_num = 4;
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto db_path = std::string{path};
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(make_registry_options(), db_path, &database);
  if (!status.ok()) {
    notary::common::critical("cannot open registry database at {}: {}",
                             db_path, status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  store.pending = std::make_unique<ROCKSDB_NAMESPACE::WriteBatchWithIndex>(
      ROCKSDB_NAMESPACE::BytewiseComparator(), 0, true);
  spdlog::info("Registry database ready at {}", db_path);
  return store;
}

}  // namespace notary::storage
