#pragma once
#include <crowdfund/schema/primitives.hpp>

// Schema type: submit proposal.
// Review workflow: the signer proposes campaign terms for review.
namespace crowdfund::schema {

template <uint16_t Version>
struct submit_proposal;

template <>
struct submit_proposal<1> final {
  uint16_t version{1};
  amount_t min_target{};
  amount_t max_target{};
  timestamp_milliseconds_t window_start{};
  timestamp_milliseconds_t window_end{};
};

using submit_proposal_t = submit_proposal<1>;

}  // namespace crowdfund::schema
