#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: app info.
// Application identity and the last committed checkpoint, with registry and
// ledger counts as of the call.
namespace crowdfund::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string name{"crowdfund-ledger"};
  std::string version{"0.1.0"};
  hash32_t chain_id{};
  int64_t last_block_height{};
  hash32_t last_block_state_root{};
  uint64_t proposal_count{};
  uint64_t ledger_count{};
};

using app_info_t = app_info<1>;

}  // namespace crowdfund::schema
