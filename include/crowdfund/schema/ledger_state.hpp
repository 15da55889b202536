#pragma once
#include <crowdfund/schema/ledger_terms.hpp>
#include <crowdfund/schema/primitives.hpp>

// Schema type: ledger state.
// Campaign ledger: aggregate accounting for one deployed campaign. Per
// contributor balances are stored as separate rows.
namespace crowdfund::schema {

template <uint16_t Version>
struct ledger_state;

template <>
struct ledger_state<1> final {
  uint16_t version{1};
  hash32_t ledger_id{};
  uint64_t proposal_id{};
  ledger_terms_t terms{};
  amount_t total_collected{};
  bool claimed{};
};

using ledger_state_t = ledger_state<1>;

}  // namespace crowdfund::schema
