#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace crowdfund::schema {

enum class transaction_error_code : uint32_t {
  // envelope
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  // validation
  invalid_amounts = 10,
  invalid_window = 11,
  invalid_amount = 12,
  invalid_asset = 13,
  invalid_identity = 14,
  // authorization
  unauthorized = 20,
  // lifecycle state
  unknown_proposal = 30,
  already_reviewed = 31,
  unknown_ledger = 32,
  not_active = 33,
  target_exceeded = 34,
  already_claimed = 35,
  not_ended = 36,
  target_not_reached = 37,
  campaign_successful = 38,
  no_contribution = 39,
  reentrant_call = 40,
  // external collaborators
  transfer_failed = 50,
};

template <>
struct enum_names<transaction_error_code> {
  using code = transaction_error_code;
  static constexpr auto values = std::array{
      enum_name_t<code>{"invalid_transaction", code::invalid_transaction},
      enum_name_t<code>{"unsupported_transaction_version",
                        code::unsupported_transaction_version},
      enum_name_t<code>{"invalid_chain_id", code::invalid_chain_id},
      enum_name_t<code>{"invalid_nonce", code::invalid_nonce},
      enum_name_t<code>{"invalid_amounts", code::invalid_amounts},
      enum_name_t<code>{"invalid_window", code::invalid_window},
      enum_name_t<code>{"invalid_amount", code::invalid_amount},
      enum_name_t<code>{"invalid_asset", code::invalid_asset},
      enum_name_t<code>{"invalid_identity", code::invalid_identity},
      enum_name_t<code>{"unauthorized", code::unauthorized},
      enum_name_t<code>{"unknown_proposal", code::unknown_proposal},
      enum_name_t<code>{"already_reviewed", code::already_reviewed},
      enum_name_t<code>{"unknown_ledger", code::unknown_ledger},
      enum_name_t<code>{"not_active", code::not_active},
      enum_name_t<code>{"target_exceeded", code::target_exceeded},
      enum_name_t<code>{"already_claimed", code::already_claimed},
      enum_name_t<code>{"not_ended", code::not_ended},
      enum_name_t<code>{"target_not_reached", code::target_not_reached},
      enum_name_t<code>{"campaign_successful", code::campaign_successful},
      enum_name_t<code>{"no_contribution", code::no_contribution},
      enum_name_t<code>{"reentrant_call", code::reentrant_call},
      enum_name_t<code>{"transfer_failed", code::transfer_failed}};
};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return enum_name(value);
}

/// Taxonomy bucket of an error code: envelope, validation, authorization,
/// state or external.
inline constexpr std::string_view error_category(
    const transaction_error_code value) {
  const auto raw = static_cast<uint32_t>(value);
  if (raw < 10) {
    return "envelope";
  }
  if (raw < 20) {
    return "validation";
  }
  if (raw < 30) {
    return "authorization";
  }
  if (raw < 50) {
    return "state";
  }
  return "external";
}

}  // namespace crowdfund::schema
