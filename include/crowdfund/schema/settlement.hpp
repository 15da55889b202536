#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema types: claim funds and refund.
// Campaign ledger settlement: the creator claims a successful campaign, each
// contributor refunds a failed one.
namespace crowdfund::schema {

template <uint16_t Version>
struct claim_funds;

template <>
struct claim_funds<1> final {
  uint16_t version{1};
  hash32_t ledger_id{};
};

using claim_funds_t = claim_funds<1>;

template <uint16_t Version>
struct refund;

template <>
struct refund<1> final {
  uint16_t version{1};
  hash32_t ledger_id{};
};

using refund_t = refund<1>;

}  // namespace crowdfund::schema
