#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace crowdfund::storage {

namespace detail {

using encoder_t = crowdfund::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const crowdfund::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline crowdfund::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const crowdfund::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const crowdfund::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const crowdfund::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const crowdfund::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

 private:
  void require_open() const;

  /// Call `visit(iterator)` for every row under `prefix`.
  template <typename Visitor>
  void scan_prefix(const crowdfund::schema::bytes_view_t& prefix,
                   Visitor&& visit) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    crowdfund::common::critical("RocksDB database is not initialized");
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const crowdfund::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    crowdfund::common::critical("Failed to get value from RocksDB: {}",
                                status.ToString());
  }
  return {encoder.template decode<T>(crowdfund::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const crowdfund::schema::bytes_view_t& key,
    const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(crowdfund::schema::bytes_view_t{encoded_value.data(),
                                                       encoded_value.size()}));
  if (!status.ok()) {
    crowdfund::common::critical("Failed to put value into RocksDB: {}",
                                status.ToString());
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    crowdfund::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, crowdfund::schema::hash32_t>>(
          crowdfund::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    crowdfund::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_open();
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedHeightKey},
      std::string{reinterpret_cast<const char*>(encoded.data()),
                  encoded.size()});
  if (!state_status.ok()) {
    crowdfund::common::critical("failed to persist committed height");
  }
}

template <typename Visitor>
void storage<rocksdb_storage_tag>::scan_prefix(
    const crowdfund::schema::bytes_view_t& prefix,
    Visitor&& visit) const {
  require_open();
  const auto wanted = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(wanted);
       iterator->Valid() && iterator->key().starts_with(wanted);
       iterator->Next()) {
    visit(*iterator);
  }
  if (!iterator->status().ok()) {
    crowdfund::common::critical("failed scanning RocksDB prefix: {}",
                                iterator->status().ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const crowdfund::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  scan_prefix(prefix, [&](const ROCKSDB_NAMESPACE::Iterator& row) {
    entries.emplace_back(detail::to_bytes(row.key()),
                         detail::to_bytes(row.value()));
  });
  return entries;
}

inline void storage<rocksdb_storage_tag>::replace_by_prefix(
    const crowdfund::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  scan_prefix(prefix, [&](const ROCKSDB_NAMESPACE::Iterator& row) {
    auto status = batch.Delete(row.key());
    if (!status.ok()) {
      crowdfund::common::critical("failed staging delete: {}",
                                  status.ToString());
    }
  });
  for (const auto& [key, value] : entries) {
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      crowdfund::common::critical("failed staging put: {}", status.ToString());
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    crowdfund::common::critical("failed to replace RocksDB prefix: {}",
                                status.ToString());
  }
}

}  // namespace crowdfund::storage
