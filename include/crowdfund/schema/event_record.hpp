#pragma once

#include <crowdfund/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Persisted event log row: sequential id plus the block position that emitted
// it.
namespace crowdfund::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace crowdfund::schema
