#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: ledger terms.
// Campaign ledger: terms frozen from an accepted proposal.
namespace crowdfund::schema {

template <uint16_t Version>
struct ledger_terms;

template <>
struct ledger_terms<1> final {
  uint16_t version{1};
  account_id_t creator{};
  amount_t min_target{};
  amount_t max_target{};
  timestamp_milliseconds_t window_start{};
  timestamp_milliseconds_t window_end{};
  asset_id_t settlement_asset{};
};

using ledger_terms_t = ledger_terms<1>;

}  // namespace crowdfund::schema
