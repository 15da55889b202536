#include <crowdfund/schema/key/engine_keys.hpp>

#include <crowdfund/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <tuple>

namespace crowdfund::schema::key {

namespace {

using key_encoder_t = crowdfund::schema::encoding::scale_encoder_t;

std::optional<crowdfund::schema::bytes_view_t> strip_prefix(
    const crowdfund::schema::bytes_view_t& key,
    const std::string_view prefix) {
  auto key_view =
      std::string_view{reinterpret_cast<const char*>(key.data()), key.size()};
  if (!key_view.starts_with(prefix)) {
    return std::nullopt;
  }
  return key.subspan(prefix.size());
}

}  // namespace

crowdfund::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const crowdfund::schema::bytes_t& id) {
  auto key = crowdfund::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

crowdfund::schema::bytes_t make_registry_key() {
  return make_prefixed_key(
      kRegistryKeyPrefix,
      crowdfund::schema::make_bytes(std::string_view{"CURRENT"}));
}

crowdfund::schema::bytes_t make_proposal_key(uint64_t proposal_id) {
  return make_prefixed_key(kProposalKeyPrefix,
                           key_encoder_t{}.encode(proposal_id));
}

crowdfund::schema::bytes_t make_ledger_key(
    const crowdfund::schema::hash32_t& ledger_id) {
  return make_prefixed_key(
      kLedgerKeyPrefix,
      crowdfund::schema::bytes_t{std::begin(ledger_id), std::end(ledger_id)});
}

crowdfund::schema::bytes_t make_balance_key(
    const crowdfund::schema::hash32_t& ledger_id,
    const crowdfund::schema::account_id_t& account) {
  return make_prefixed_key(kBalanceKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{ledger_id, account}));
}

crowdfund::schema::bytes_t make_nonce_key(
    const crowdfund::schema::account_id_t& signer) {
  return make_prefixed_key(
      kNonceKeyPrefix,
      crowdfund::schema::bytes_t{std::begin(signer), std::end(signer)});
}

crowdfund::schema::bytes_t make_event_sequence_key() {
  return make_prefixed_key(kEventSeqKeyPrefix, crowdfund::schema::make_bytes(
                                                   std::string_view{"NEXT"}));
}

crowdfund::schema::bytes_t make_event_key(uint64_t event_id) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(event_id));
}

std::optional<std::pair<crowdfund::schema::hash32_t,
                        crowdfund::schema::account_id_t>>
parse_balance_key(const crowdfund::schema::bytes_view_t& key) {
  auto encoded = strip_prefix(key, kBalanceKeyPrefix);
  if (!encoded) {
    return std::nullopt;
  }
  auto decoded = key_encoder_t{}
                     .try_decode<std::tuple<crowdfund::schema::hash32_t,
                                            crowdfund::schema::account_id_t>>(
                         *encoded);
  if (!decoded) {
    return std::nullopt;
  }
  return std::pair{std::get<0>(decoded.value()), std::get<1>(decoded.value())};
}

std::optional<crowdfund::schema::account_id_t> parse_nonce_key(
    const crowdfund::schema::bytes_view_t& key) {
  auto encoded = strip_prefix(key, kNonceKeyPrefix);
  if (!encoded || encoded->size() != crowdfund::schema::account_id_t{}.size()) {
    return std::nullopt;
  }
  auto signer = crowdfund::schema::account_id_t{};
  std::copy(encoded->begin(), encoded->end(), signer.begin());
  return signer;
}

}  // namespace crowdfund::schema::key
