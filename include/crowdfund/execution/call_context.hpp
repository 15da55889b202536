#pragma once

#include <crowdfund/schema/primitives.hpp>

namespace crowdfund::execution {

/// Calling principal and clock reading for one operation.
struct call_context final {
  crowdfund::schema::account_id_t caller{};
  crowdfund::schema::timestamp_milliseconds_t now{};
};

}  // namespace crowdfund::execution
