#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: contribute.
// Campaign ledger: pledge `amount` units of `source_asset` to a ledger.
namespace crowdfund::schema {

template <uint16_t Version>
struct contribute;

template <>
struct contribute<1> final {
  uint16_t version{1};
  hash32_t ledger_id{};
  amount_t amount{};
  asset_id_t source_asset{};
};

using contribute_t = contribute<1>;

}  // namespace crowdfund::schema
