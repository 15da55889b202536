#pragma once
#include <crowdfund/schema/contribute.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/review_proposal.hpp>
#include <crowdfund/schema/settlement.hpp>
#include <crowdfund/schema/submit_proposal.hpp>
#include <crowdfund/schema/transfer_reviewer_role.hpp>
#include <variant>

namespace crowdfund::schema {

using transaction_payload_t = std::variant<submit_proposal_t,
                                           review_proposal_t,
                                           transfer_reviewer_role_t,
                                           contribute_t,
                                           claim_funds_t,
                                           refund_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace crowdfund::schema
