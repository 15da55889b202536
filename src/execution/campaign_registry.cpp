#include <spdlog/spdlog.h>
#include <algorithm>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/execution/campaign_registry.hpp>
#include <crowdfund/execution/events.hpp>
#include <string>
#include <utility>

using namespace crowdfund::schema;

namespace {

transaction_result_t reject(const transaction_error_code code,
                            std::string log) {
  spdlog::debug("Registry rejected call: {} ({})", log, to_string(code));
  return crowdfund::execution::make_failure(
      code, crowdfund::execution::kRegistryCodespace, std::move(log));
}

}  // namespace

namespace crowdfund::execution {

campaign_registry::campaign_registry(const account_id_t& reviewer,
                                     const asset_id_t& settlement_asset,
                                     ledger_factory_t factory)
    : reviewer_{reviewer},
      settlement_asset_{settlement_asset},
      factory_{std::move(factory)} {
  if (!factory_) {
    crowdfund::common::critical("campaign registry requires a ledger factory");
  }
}

transaction_result_t campaign_registry::submit(
    const call_context& context,
    const submit_proposal_t& operation) {
  if (operation.max_target <= operation.min_target) {
    return reject(transaction_error_code::invalid_amounts,
                  "max_target must be greater than min_target");
  }
  if (operation.window_start <= context.now) {
    return reject(transaction_error_code::invalid_window,
                  "window_start must be in the future");
  }
  if (operation.window_end <= operation.window_start) {
    return reject(transaction_error_code::invalid_window,
                  "window_end must be after window_start");
  }

  const auto proposal_id = static_cast<uint64_t>(proposals_.size());
  proposals_.push_back(proposal_state_t{.proposal_id = proposal_id,
                                        .submitter = context.caller,
                                        .min_target = operation.min_target,
                                        .max_target = operation.max_target,
                                        .window_start = operation.window_start,
                                        .window_end = operation.window_end,
                                        .created_at = context.now,
                                        .status = proposal_status_t::pending});
  history_[context.caller].push_back(proposal_id);

  spdlog::info("Proposal {} submitted by {}", proposal_id,
               to_hex(context.caller));
  auto result = transaction_result_t{};
  result.info = "submit_proposal accepted";
  result.events.push_back(
      make_event(event_type_t::proposal_submitted,
                 {attribute("proposal_id", proposal_id, true),
                  attribute("submitter", context.caller, true),
                  attribute("min_target", operation.min_target),
                  attribute("max_target", operation.max_target),
                  attribute("window_start", operation.window_start),
                  attribute("window_end", operation.window_end)}));
  return result;
}

transaction_result_t campaign_registry::review(
    const call_context& context,
    const review_proposal_t& operation) {
  if (context.caller != reviewer_) {
    return reject(transaction_error_code::unauthorized,
                  "only the reviewer can review proposals");
  }
  if (operation.proposal_id >= proposals_.size()) {
    return reject(transaction_error_code::unknown_proposal,
                  "proposal id was never issued");
  }
  auto& proposal = proposals_[operation.proposal_id];
  if (proposal.status != proposal_status_t::pending) {
    return reject(transaction_error_code::already_reviewed,
                  "proposal was already reviewed");
  }

  auto result = transaction_result_t{};
  result.info = "review_proposal accepted";
  if (operation.approve) {
    const auto terms = ledger_terms_t{.creator = proposal.submitter,
                                      .min_target = proposal.min_target,
                                      .max_target = proposal.max_target,
                                      .window_start = proposal.window_start,
                                      .window_end = proposal.window_end,
                                      .settlement_asset = settlement_asset_};
    const auto ledger_id = factory_(proposal.proposal_id, terms);
    proposal.ledger_id = ledger_id;
    proposal.status = proposal_status_t::accepted;
    spdlog::info("Proposal {} accepted; ledger {} deployed",
                 proposal.proposal_id, to_hex(ledger_id));
    result.events.push_back(
        make_event(event_type_t::ledger_deployed,
                   {attribute("proposal_id", proposal.proposal_id, true),
                    attribute("ledger_id", ledger_id, true),
                    attribute("creator", proposal.submitter)}));
  } else {
    proposal.status = proposal_status_t::rejected;
    spdlog::info("Proposal {} rejected", proposal.proposal_id);
  }
  result.events.push_back(
      make_event(event_type_t::proposal_reviewed,
                 {attribute("proposal_id", proposal.proposal_id, true),
                  attribute("approved", operation.approve)}));
  return result;
}

transaction_result_t campaign_registry::transfer_reviewer_role(
    const call_context& context,
    const transfer_reviewer_role_t& operation) {
  if (context.caller != reviewer_) {
    return reject(transaction_error_code::unauthorized,
                  "only the reviewer can hand over the role");
  }
  if (is_null_identity(operation.new_reviewer)) {
    return reject(transaction_error_code::invalid_identity,
                  "new reviewer must not be the null identity");
  }

  const auto previous = reviewer_;
  reviewer_ = operation.new_reviewer;
  spdlog::info("Reviewer role moved from {} to {}", to_hex(previous),
               to_hex(reviewer_));
  auto result = transaction_result_t{};
  result.info = "transfer_reviewer_role accepted";
  result.events.push_back(
      make_event(event_type_t::reviewer_changed,
                 {attribute("previous_reviewer", previous),
                  attribute("new_reviewer", reviewer_, true)}));
  return result;
}

std::optional<proposal_state_t> campaign_registry::get_proposal(
    const uint64_t proposal_id) const {
  if (proposal_id >= proposals_.size()) {
    return std::nullopt;
  }
  return proposals_[proposal_id];
}

std::vector<uint64_t> campaign_registry::get_submitter_history(
    const account_id_t& submitter) const {
  auto found = history_.find(submitter);
  if (found == std::end(history_)) {
    return {};
  }
  return found->second;
}

void campaign_registry::restore(const account_id_t& reviewer,
                                const asset_id_t& settlement_asset,
                                std::vector<proposal_state_t> proposals) {
  std::ranges::sort(proposals, {}, &proposal_state_t::proposal_id);
  for (size_t i = 0; i < proposals.size(); ++i) {
    if (proposals[i].proposal_id != i) {
      crowdfund::common::critical(
          "persisted proposals are not sequential at index {}", i);
    }
    const auto accepted = proposals[i].status == proposal_status_t::accepted;
    if (proposals[i].ledger_id.has_value() != accepted) {
      crowdfund::common::critical(
          "persisted proposal {} has status {} but {} ledger id", i,
          to_string(proposals[i].status),
          proposals[i].ledger_id ? "a" : "no");
    }
  }

  reviewer_ = reviewer;
  settlement_asset_ = settlement_asset;
  proposals_ = std::move(proposals);
  history_.clear();
  for (const auto& proposal : proposals_) {
    history_[proposal.submitter].push_back(proposal.proposal_id);
  }
}

}  // namespace crowdfund::execution
