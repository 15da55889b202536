#pragma once
#include <crowdfund/schema/ledger_state.hpp>

// Schema type: ledger details.
// Read snapshot of a ledger; the flags are derived from the read time and
// never persisted.
namespace crowdfund::schema {

template <uint16_t Version>
struct ledger_details;

template <>
struct ledger_details<1> final {
  uint16_t version{1};
  ledger_state_t state{};
  bool is_active{};
  bool is_successful{};
};

using ledger_details_t = ledger_details<1>;

}  // namespace crowdfund::schema
