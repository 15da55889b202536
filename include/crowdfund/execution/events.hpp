#pragma once

#include <crowdfund/schema/event_type.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_error_code.hpp>
#include <crowdfund/schema/transaction_event.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace crowdfund::execution {

inline constexpr auto kRegistryCodespace = std::string_view{"crowdfund.registry"};
inline constexpr auto kLedgerCodespace = std::string_view{"crowdfund.ledger"};

crowdfund::schema::transaction_event_attribute_t attribute(std::string key,
                                                           std::string value,
                                                           bool index = false);
crowdfund::schema::transaction_event_attribute_t attribute(
    std::string key,
    const crowdfund::schema::hash32_t& value,
    bool index = false);
crowdfund::schema::transaction_event_attribute_t attribute(
    std::string key,
    const crowdfund::schema::amount_t& value,
    bool index = false);
crowdfund::schema::transaction_event_attribute_t attribute(std::string key,
                                                           uint64_t value,
                                                           bool index = false);
crowdfund::schema::transaction_event_attribute_t attribute(std::string key,
                                                           bool value);

crowdfund::schema::transaction_event_t make_event(
    crowdfund::schema::event_type_t type,
    std::vector<crowdfund::schema::transaction_event_attribute_t> attributes);

/// Failed result carrying `code`, its name as `info` and a readable `log`.
crowdfund::schema::transaction_result_t make_failure(
    crowdfund::schema::transaction_error_code code,
    std::string_view codespace,
    std::string log);

}  // namespace crowdfund::execution
