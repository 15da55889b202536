#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: review proposal.
// Review workflow: reviewer decision; approval deploys a ledger.
namespace crowdfund::schema {

template <uint16_t Version>
struct review_proposal;

template <>
struct review_proposal<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
  bool approve{};
};

using review_proposal_t = review_proposal<1>;

}  // namespace crowdfund::schema
