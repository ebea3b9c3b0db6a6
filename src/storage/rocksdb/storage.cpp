#include <atelier/common/critical.hpp>
#include <atelier/storage/rocksdb/storage.hpp>
#include <rocksdb/table.h>

namespace {

// Escrow records, counters and hints are small point lookups; a bloom
// filter keeps misses (unknown ids, first-time balances) off disk.
ROCKSDB_NAMESPACE::Options make_escrow_store_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.IncreaseParallelism();
  options.OptimizeForPointLookup(64);
  return options;
}

}  // namespace

namespace atelier::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    atelier::common::critical("escrow store path is empty");
  }

  auto* raw = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_escrow_store_options(),
                                            std::string{path}, &raw);
  if (!status.ok()) {
    atelier::common::critical("cannot open escrow store at {}: {}", path,
                              status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  spdlog::info("Opened escrow store at {}", path);
  return store;
}

}  // namespace atelier::storage
