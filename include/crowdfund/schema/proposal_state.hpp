#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/proposal_status.hpp>
#include <optional>

// Schema type: proposal state.
// Review workflow: campaign terms awaiting (or past) the reviewer's decision.
namespace crowdfund::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  uint64_t proposal_id{};
  account_id_t submitter{};
  amount_t min_target{};
  amount_t max_target{};
  timestamp_milliseconds_t window_start{};
  timestamp_milliseconds_t window_end{};
  timestamp_milliseconds_t created_at{};
  proposal_status_t status{proposal_status_t::pending};
  // Set exactly when status == accepted.
  std::optional<hash32_t> ledger_id;
};

using proposal_state_t = proposal_state<1>;

}  // namespace crowdfund::schema
