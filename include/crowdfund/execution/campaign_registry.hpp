#pragma once

#include <crowdfund/execution/call_context.hpp>
#include <crowdfund/schema/ledger_terms.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/proposal_state.hpp>
#include <crowdfund/schema/review_proposal.hpp>
#include <crowdfund/schema/submit_proposal.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <crowdfund/schema/transfer_reviewer_role.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace crowdfund::execution {

/// Deploy a ledger for an accepted proposal and return its id.
using ledger_factory_t = std::function<crowdfund::schema::hash32_t(
    uint64_t proposal_id,
    const crowdfund::schema::ledger_terms_t& terms)>;

/// Proposal intake and review.
///
/// Proposals get sequential ids in submission order. A single reviewer
/// decides each pending proposal once; approval deploys a ledger through the
/// factory and records only the returned ledger id.
class campaign_registry final {
 public:
  campaign_registry(const crowdfund::schema::account_id_t& reviewer,
                    const crowdfund::schema::asset_id_t& settlement_asset,
                    ledger_factory_t factory);

  crowdfund::schema::transaction_result_t submit(
      const call_context& context,
      const crowdfund::schema::submit_proposal_t& operation);

  crowdfund::schema::transaction_result_t review(
      const call_context& context,
      const crowdfund::schema::review_proposal_t& operation);

  crowdfund::schema::transaction_result_t transfer_reviewer_role(
      const call_context& context,
      const crowdfund::schema::transfer_reviewer_role_t& operation);

  /// std::nullopt for an id that was never issued.
  std::optional<crowdfund::schema::proposal_state_t> get_proposal(
      uint64_t proposal_id) const;

  /// Proposal ids of `submitter` in submission order.
  std::vector<uint64_t> get_submitter_history(
      const crowdfund::schema::account_id_t& submitter) const;

  const crowdfund::schema::account_id_t& reviewer() const { return reviewer_; }
  const crowdfund::schema::asset_id_t& settlement_asset() const {
    return settlement_asset_;
  }
  uint64_t proposal_count() const { return proposals_.size(); }
  const std::vector<crowdfund::schema::proposal_state_t>& proposals() const {
    return proposals_;
  }

  /// Replace in-memory state with persisted rows. Terminates when the ids are
  /// not the sequence 0..n-1 or a ledger id disagrees with the status.
  void restore(const crowdfund::schema::account_id_t& reviewer,
               const crowdfund::schema::asset_id_t& settlement_asset,
               std::vector<crowdfund::schema::proposal_state_t> proposals);

 private:
  crowdfund::schema::account_id_t reviewer_;
  crowdfund::schema::asset_id_t settlement_asset_;
  ledger_factory_t factory_;
  std::vector<crowdfund::schema::proposal_state_t> proposals_;
  std::map<crowdfund::schema::account_id_t, std::vector<uint64_t>> history_;
};

}  // namespace crowdfund::execution
