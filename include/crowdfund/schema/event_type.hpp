#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Notification stream: one value per state-mutating outcome, rendered as the
// transaction_event type string.
namespace crowdfund::schema {

enum class event_type_t : uint8_t {
  proposal_submitted = 0,
  proposal_reviewed = 1,
  ledger_deployed = 2,
  reviewer_changed = 3,
  contribution_recorded = 4,
  funds_claimed = 5,
  campaign_ended = 6,
  refund_processed = 7
};

template <>
struct enum_names<event_type_t> {
  static constexpr auto values = std::array{
      enum_name_t<event_type_t>{"proposal_submitted",
                                event_type_t::proposal_submitted},
      enum_name_t<event_type_t>{"proposal_reviewed",
                                event_type_t::proposal_reviewed},
      enum_name_t<event_type_t>{"ledger_deployed",
                                event_type_t::ledger_deployed},
      enum_name_t<event_type_t>{"reviewer_changed",
                                event_type_t::reviewer_changed},
      enum_name_t<event_type_t>{"contribution_recorded",
                                event_type_t::contribution_recorded},
      enum_name_t<event_type_t>{"funds_claimed", event_type_t::funds_claimed},
      enum_name_t<event_type_t>{"campaign_ended",
                                event_type_t::campaign_ended},
      enum_name_t<event_type_t>{"refund_processed",
                                event_type_t::refund_processed}};
};

inline constexpr std::string_view to_string(const event_type_t value) {
  return enum_name(value);
}

}  // namespace crowdfund::schema
