#pragma once

#include <gtest/gtest.h>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_event.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

namespace crowdfund::testing {

inline constexpr crowdfund::schema::timestamp_milliseconds_t kDay =
    24ull * 60ull * 60ull * 1000ull;

inline crowdfund::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = crowdfund::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Account whose first byte is `seed`; never the null identity for seed > 0.
inline crowdfund::schema::account_id_t make_account(const uint8_t seed) {
  auto account = crowdfund::schema::account_id_t{};
  account[0] = seed;
  return account;
}

/// Fresh directory under the system temp dir, tagged with the running test.
inline std::string make_db_path(const std::string_view prefix) {
  auto name = std::string{prefix};
  if (const auto* info =
          ::testing::UnitTest::GetInstance()->current_test_info()) {
    name += "_";
    name += info->name();
  }
  auto device = std::random_device{};
  name += "_" + std::to_string(device()) + std::to_string(device());
  return (std::filesystem::temp_directory_path() / name).string();
}

/// Value of the first attribute named `key`, if any.
inline std::optional<std::string> find_attribute(
    const crowdfund::schema::transaction_event_t& event,
    const std::string_view key) {
  auto found = std::ranges::find_if(
      event.attributes,
      [&](const crowdfund::schema::transaction_event_attribute_t& attribute) {
        return attribute.key == key;
      });
  if (found == std::end(event.attributes)) {
    return std::nullopt;
  }
  return found->value;
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace crowdfund::testing
