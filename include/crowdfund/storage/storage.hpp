#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace crowdfund::storage {

using key_value_entry_t =
    std::pair<crowdfund::schema::bytes_t, crowdfund::schema::bytes_t>;

/// Height and state root of the last commit.
struct committed_state final {
  int64_t height{};
  crowdfund::schema::hash32_t state_root{};
};

/// Key-value backend selected by tag. Keys are raw bytes from
/// crowdfund::schema::key; values go through the caller's encoder. Backend
/// failures are fatal and reported through common::critical.
template <typename Library>
struct storage {
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const crowdfund::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const crowdfund::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;

  /// Rows whose key starts with `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const crowdfund::schema::bytes_view_t& prefix) const;

  /// Delete every row under `prefix` and write `entries` in one batch.
  void replace_by_prefix(const crowdfund::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace crowdfund::storage
