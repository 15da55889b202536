#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <functional>

namespace crowdfund::execution {

/// Move `amount` of `asset` from one account to another. Returns false when
/// the transfer did not happen; a transfer is all-or-nothing.
///
/// The engine invokes the capability while holding its non-recursive mutex.
/// It must not call back into the engine (finalize_block, commit, query or
/// any accessor); doing so deadlocks. Calling straight back into the same
/// campaign_ledger is safe and is rejected with reentrant_call.
using asset_transfer_t =
    std::function<bool(const crowdfund::schema::asset_id_t& asset,
                       const crowdfund::schema::account_id_t& from,
                       const crowdfund::schema::account_id_t& to,
                       const crowdfund::schema::amount_t& amount)>;

}  // namespace crowdfund::execution
