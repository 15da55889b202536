#pragma once

#include <crowdfund/execution/asset_transfer.hpp>
#include <crowdfund/execution/call_context.hpp>
#include <crowdfund/schema/contribute.hpp>
#include <crowdfund/schema/ledger_details.hpp>
#include <crowdfund/schema/ledger_state.hpp>
#include <crowdfund/schema/ledger_terms.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <cstdint>
#include <map>

namespace crowdfund::execution {

/// Funds accounting for one deployed campaign.
///
/// Contributions are accepted during [window_start, window_end]. Once the
/// window has closed, a campaign that reached min_target can be claimed once
/// by its creator; otherwise every contributor can refund their balance once.
/// The ledger id doubles as the custody account holding contributed funds.
class campaign_ledger final {
 public:
  campaign_ledger(const crowdfund::schema::hash32_t& ledger_id,
                  uint64_t proposal_id,
                  const crowdfund::schema::ledger_terms_t& terms,
                  asset_transfer_t transfer);

  /// Rebuild a ledger from persisted rows. Terminates when the balances do
  /// not add up to total_collected.
  campaign_ledger(
      crowdfund::schema::ledger_state_t state,
      std::map<crowdfund::schema::account_id_t, crowdfund::schema::amount_t>
          balances,
      asset_transfer_t transfer);

  campaign_ledger(const campaign_ledger&) = delete;
  campaign_ledger& operator=(const campaign_ledger&) = delete;

  crowdfund::schema::transaction_result_t contribute(
      const call_context& context,
      const crowdfund::schema::contribute_t& operation);

  /// Pay total_collected to the creator of a successful campaign.
  crowdfund::schema::transaction_result_t claim_funds(
      const call_context& context);

  /// Return the caller's balance from a failed campaign.
  crowdfund::schema::transaction_result_t refund(const call_context& context);

  crowdfund::schema::ledger_details_t get_details(
      crowdfund::schema::timestamp_milliseconds_t now) const;

  crowdfund::schema::amount_t balance_of(
      const crowdfund::schema::account_id_t& account) const;

  const crowdfund::schema::hash32_t& id() const { return state_.ledger_id; }
  const crowdfund::schema::ledger_state_t& state() const { return state_; }
  const std::map<crowdfund::schema::account_id_t, crowdfund::schema::amount_t>&
  balances() const {
    return balances_;
  }

 private:
  bool transfer(const crowdfund::schema::account_id_t& from,
                const crowdfund::schema::asset_id_t& asset,
                const crowdfund::schema::account_id_t& to,
                const crowdfund::schema::amount_t& amount) const;

  crowdfund::schema::ledger_state_t state_;
  std::map<crowdfund::schema::account_id_t, crowdfund::schema::amount_t>
      balances_;
  asset_transfer_t transfer_;
  bool busy_{};
};

}  // namespace crowdfund::execution
