#include <spdlog/spdlog.h>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>

namespace crowdfund::storage {

namespace {

ROCKSDB_NAMESPACE::Options ledger_store_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(ledger_store_options(), std::string{path},
                                  &raw);
  if (!status.ok()) {
    crowdfund::common::critical("cannot open crowdfund store at {}: {}", path,
                                status.ToString());
  }
  spdlog::debug("crowdfund store open at {}", path);
  return storage<rocksdb_storage_tag>{
      .database = std::unique_ptr<ROCKSDB_NAMESPACE::DB>{raw}};
}

}  // namespace crowdfund::storage
