#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Schema types: transaction event and its attributes.
// A successful state-mutating call emits one event per outcome. `type` is the
// event_type_t name; identities are lowercase hex and amounts decimal.
namespace crowdfund::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  // Indexed attributes are the ones observers filter on (ids, accounts).
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace crowdfund::schema
