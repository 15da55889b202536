#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for registry, ledger, nonce and event
// rows.
namespace crowdfund::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kLedgerKeyPrefix{"SYS|STATE|LEDGER|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

crowdfund::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const crowdfund::schema::bytes_t& id);

crowdfund::schema::bytes_t make_registry_key();
crowdfund::schema::bytes_t make_proposal_key(uint64_t proposal_id);
crowdfund::schema::bytes_t make_ledger_key(
    const crowdfund::schema::hash32_t& ledger_id);
crowdfund::schema::bytes_t make_balance_key(
    const crowdfund::schema::hash32_t& ledger_id,
    const crowdfund::schema::account_id_t& account);
crowdfund::schema::bytes_t make_nonce_key(
    const crowdfund::schema::account_id_t& signer);
crowdfund::schema::bytes_t make_event_sequence_key();
crowdfund::schema::bytes_t make_event_key(uint64_t event_id);

std::optional<std::pair<crowdfund::schema::hash32_t,
                        crowdfund::schema::account_id_t>>
parse_balance_key(const crowdfund::schema::bytes_view_t& key);
std::optional<crowdfund::schema::account_id_t> parse_nonce_key(
    const crowdfund::schema::bytes_view_t& key);

}  // namespace crowdfund::schema::key
