#include <spdlog/spdlog.h>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/execution/campaign_ledger.hpp>
#include <crowdfund/execution/events.hpp>
#include <crowdfund/execution/reentrancy_guard.hpp>
#include <string>
#include <utility>

using namespace crowdfund::schema;

namespace {

bool window_closed(const ledger_terms_t& terms,
                   const timestamp_milliseconds_t now) {
  return now > terms.window_end;
}

bool window_open(const ledger_terms_t& terms,
                 const timestamp_milliseconds_t now) {
  return now >= terms.window_start && now <= terms.window_end;
}

transaction_result_t reject(const transaction_error_code code,
                            const hash32_t& ledger_id,
                            std::string log) {
  spdlog::debug("Ledger {} rejected call: {} ({})", to_hex(ledger_id), log,
                to_string(code));
  return crowdfund::execution::make_failure(
      code, crowdfund::execution::kLedgerCodespace, std::move(log));
}

}  // namespace

namespace crowdfund::execution {

campaign_ledger::campaign_ledger(const hash32_t& ledger_id,
                                 const uint64_t proposal_id,
                                 const ledger_terms_t& terms,
                                 asset_transfer_t transfer)
    : state_{ledger_state_t{.ledger_id = ledger_id,
                            .proposal_id = proposal_id,
                            .terms = terms}},
      transfer_{std::move(transfer)} {}

campaign_ledger::campaign_ledger(ledger_state_t state,
                                 std::map<account_id_t, amount_t> balances,
                                 asset_transfer_t transfer)
    : state_{std::move(state)},
      balances_{std::move(balances)},
      transfer_{std::move(transfer)} {
  auto sum = amount_t{};
  for (const auto& [account, balance] : balances_) {
    (void)account;
    sum += balance;
  }
  if (sum != state_.total_collected) {
    crowdfund::common::critical(
        "ledger {} balances sum to {} but total_collected is {}",
        to_hex(state_.ledger_id), to_string(sum),
        to_string(state_.total_collected));
  }
}

transaction_result_t campaign_ledger::contribute(const call_context& context,
                                                 const contribute_t& operation) {
  auto guard = reentrancy_guard{busy_};
  if (!guard) {
    return reject(transaction_error_code::reentrant_call, state_.ledger_id,
                  "contribute called while ledger is busy");
  }
  if (operation.ledger_id != state_.ledger_id) {
    return reject(transaction_error_code::unknown_ledger, state_.ledger_id,
                  "contribution addressed to a different ledger");
  }
  const auto& terms = state_.terms;
  if (!window_open(terms, context.now)) {
    return reject(transaction_error_code::not_active, state_.ledger_id,
                  "campaign is not accepting contributions");
  }
  if (operation.amount == 0) {
    return reject(transaction_error_code::invalid_amount, state_.ledger_id,
                  "contribution amount must be positive");
  }
  if (is_null_identity(operation.source_asset)) {
    return reject(transaction_error_code::invalid_asset, state_.ledger_id,
                  "source asset must not be null");
  }
  if (operation.amount > terms.max_target - state_.total_collected) {
    return reject(transaction_error_code::target_exceeded, state_.ledger_id,
                  "contribution would exceed max_target");
  }

  const auto previous_total = state_.total_collected;
  const auto previous_balance = balance_of(context.caller);
  balances_[context.caller] = previous_balance + operation.amount;
  state_.total_collected = previous_total + operation.amount;

  if (!transfer(context.caller, operation.source_asset, state_.ledger_id,
                operation.amount)) {
    if (previous_balance == 0) {
      balances_.erase(context.caller);
    } else {
      balances_[context.caller] = previous_balance;
    }
    state_.total_collected = previous_total;
    return reject(transaction_error_code::transfer_failed, state_.ledger_id,
                  "contribution transfer failed");
  }

  spdlog::debug("Ledger {} recorded contribution of {} from {}",
                to_hex(state_.ledger_id), to_string(operation.amount),
                to_hex(context.caller));
  auto result = transaction_result_t{};
  result.info = "contribute accepted";
  result.events.push_back(
      make_event(event_type_t::contribution_recorded,
                 {attribute("ledger_id", state_.ledger_id, true),
                  attribute("contributor", context.caller, true),
                  attribute("asset", operation.source_asset),
                  attribute("amount", operation.amount)}));
  return result;
}

transaction_result_t campaign_ledger::claim_funds(const call_context& context) {
  auto guard = reentrancy_guard{busy_};
  if (!guard) {
    return reject(transaction_error_code::reentrant_call, state_.ledger_id,
                  "claim_funds called while ledger is busy");
  }
  const auto& terms = state_.terms;
  if (context.caller != terms.creator) {
    return reject(transaction_error_code::unauthorized, state_.ledger_id,
                  "only the creator can claim funds");
  }
  if (state_.claimed) {
    return reject(transaction_error_code::already_claimed, state_.ledger_id,
                  "funds already claimed");
  }
  if (!window_closed(terms, context.now)) {
    return reject(transaction_error_code::not_ended, state_.ledger_id,
                  "campaign window has not ended");
  }
  if (state_.total_collected < terms.min_target) {
    return reject(transaction_error_code::target_not_reached, state_.ledger_id,
                  "campaign did not reach min_target");
  }

  state_.claimed = true;
  if (!transfer(state_.ledger_id, terms.settlement_asset, terms.creator,
                state_.total_collected)) {
    state_.claimed = false;
    return reject(transaction_error_code::transfer_failed, state_.ledger_id,
                  "claim transfer failed");
  }

  spdlog::info("Ledger {} claimed {} by creator {}", to_hex(state_.ledger_id),
               to_string(state_.total_collected), to_hex(terms.creator));
  auto result = transaction_result_t{};
  result.info = "claim_funds accepted";
  result.events.push_back(
      make_event(event_type_t::funds_claimed,
                 {attribute("ledger_id", state_.ledger_id, true),
                  attribute("creator", terms.creator, true),
                  attribute("amount", state_.total_collected)}));
  result.events.push_back(
      make_event(event_type_t::campaign_ended,
                 {attribute("ledger_id", state_.ledger_id, true),
                  attribute("successful", true),
                  attribute("total_collected", state_.total_collected)}));
  return result;
}

transaction_result_t campaign_ledger::refund(const call_context& context) {
  auto guard = reentrancy_guard{busy_};
  if (!guard) {
    return reject(transaction_error_code::reentrant_call, state_.ledger_id,
                  "refund called while ledger is busy");
  }
  const auto& terms = state_.terms;
  if (!window_closed(terms, context.now)) {
    return reject(transaction_error_code::not_ended, state_.ledger_id,
                  "campaign window has not ended");
  }
  if (state_.total_collected >= terms.min_target) {
    return reject(transaction_error_code::campaign_successful,
                  state_.ledger_id, "campaign reached min_target");
  }
  const auto amount = balance_of(context.caller);
  if (amount == 0) {
    return reject(transaction_error_code::no_contribution, state_.ledger_id,
                  "caller has nothing to refund");
  }

  balances_.erase(context.caller);
  state_.total_collected -= amount;
  if (!transfer(state_.ledger_id, terms.settlement_asset, context.caller,
                amount)) {
    balances_[context.caller] = amount;
    state_.total_collected += amount;
    return reject(transaction_error_code::transfer_failed, state_.ledger_id,
                  "refund transfer failed");
  }

  spdlog::debug("Ledger {} refunded {} to {}", to_hex(state_.ledger_id),
                to_string(amount), to_hex(context.caller));
  auto result = transaction_result_t{};
  result.info = "refund accepted";
  result.events.push_back(
      make_event(event_type_t::refund_processed,
                 {attribute("ledger_id", state_.ledger_id, true),
                  attribute("contributor", context.caller, true),
                  attribute("amount", amount)}));
  return result;
}

ledger_details_t campaign_ledger::get_details(
    const timestamp_milliseconds_t now) const {
  return ledger_details_t{
      .state = state_,
      .is_active = window_open(state_.terms, now),
      .is_successful = state_.total_collected >= state_.terms.min_target};
}

amount_t campaign_ledger::balance_of(const account_id_t& account) const {
  auto found = balances_.find(account);
  if (found == std::end(balances_)) {
    return amount_t{};
  }
  return found->second;
}

bool campaign_ledger::transfer(const account_id_t& from,
                               const asset_id_t& asset,
                               const account_id_t& to,
                               const amount_t& amount) const {
  if (!transfer_) {
    spdlog::warn("Ledger {} has no asset transfer capability",
                 to_hex(state_.ledger_id));
    return false;
  }
  try {
    if (!transfer_(asset, from, to, amount)) {
      spdlog::warn("Asset transfer of {} from {} to {} was refused",
                   to_string(amount), to_hex(from), to_hex(to));
      return false;
    }
    return true;
  } catch (const std::exception& ex) {
    spdlog::warn("Asset transfer of {} from {} to {} raised: {}",
                 to_string(amount), to_hex(from), to_hex(to), ex.what());
    return false;
  }
}

}  // namespace crowdfund::execution
