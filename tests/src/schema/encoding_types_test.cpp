#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/event_type.hpp>
#include <crowdfund/schema/ledger_state.hpp>
#include <crowdfund/schema/proposal_state.hpp>
#include <crowdfund/schema/transaction.hpp>
#include <crowdfund/schema/transaction_error_code.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace {

using encoder_t = crowdfund::schema::encoding::scale_encoder_t;
using crowdfund::schema::amount_t;
using crowdfund::schema::bytes_view_t;

crowdfund::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = crowdfund::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

}  // namespace

TEST(encoding_types, amounts_are_encoded_as_big_endian_words) {
  auto encoder = encoder_t{};
  auto terms = crowdfund::schema::ledger_terms_t{.min_target = 0x0102,
                                                 .max_target = 0x0203};
  auto encoded = encoder.encode(terms);
  // version(2) + creator(32) precede min_target.
  ASSERT_GE(encoded.size(), 2u + 32u + 32u);
  EXPECT_EQ(encoded[2 + 32 + 30], 0x01);
  EXPECT_EQ(encoded[2 + 32 + 31], 0x02);
}

TEST(encoding_types, ledger_state_preserves_large_amounts) {
  auto encoder = encoder_t{};
  auto state = crowdfund::schema::ledger_state_t{
      .ledger_id = make_hash(1),
      .proposal_id = 7,
      .terms = crowdfund::schema::ledger_terms_t{
          .creator = make_hash(2),
          .min_target = 1,
          .max_target = std::numeric_limits<amount_t>::max(),
          .window_start = 10,
          .window_end = 20,
          .settlement_asset = make_hash(3)},
      .total_collected = amount_t{1} << 200,
      .claimed = true};
  auto encoded = encoder.encode(state);
  auto decoded = encoder.decode<crowdfund::schema::ledger_state_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.ledger_id, state.ledger_id);
  EXPECT_EQ(decoded.proposal_id, 7u);
  EXPECT_EQ(decoded.terms.max_target, std::numeric_limits<amount_t>::max());
  EXPECT_EQ(decoded.total_collected, amount_t{1} << 200);
  EXPECT_TRUE(decoded.claimed);
}

TEST(encoding_types, proposal_with_ledger_decodes) {
  auto encoder = encoder_t{};
  auto proposal = crowdfund::schema::proposal_state_t{
      .proposal_id = 3,
      .submitter = make_hash(4),
      .min_target = 100,
      .max_target = 1000,
      .window_start = 5,
      .window_end = 6,
      .created_at = 4,
      .status = crowdfund::schema::proposal_status_t::accepted,
      .ledger_id = make_hash(9)};
  auto encoded = encoder.encode(proposal);
  auto decoded = encoder.decode<crowdfund::schema::proposal_state_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.status, crowdfund::schema::proposal_status_t::accepted);
  ASSERT_TRUE(decoded.ledger_id.has_value());
  EXPECT_EQ(*decoded.ledger_id, make_hash(9));
}

TEST(encoding_types, unknown_proposal_status_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(crowdfund::schema::proposal_state_t{});
  // Status sits after version, id, submitter, two amounts and three times.
  const auto status_offset = 2u + 8u + 32u + 32u + 32u + 8u + 8u + 8u;
  ASSERT_GT(encoded.size(), status_offset);
  encoded[status_offset] = 9;
  EXPECT_FALSE(encoder.try_decode<crowdfund::schema::proposal_state_t>(
                          bytes_view_t{encoded.data(), encoded.size()})
                   .has_value());
}

TEST(encoding_types, transaction_payload_variant_is_preserved) {
  auto encoder = encoder_t{};
  auto tx = crowdfund::schema::transaction_t{
      .version = 1,
      .chain_id = make_hash(1),
      .nonce = 42,
      .signer = make_hash(2),
      .payload = crowdfund::schema::contribute_t{
          .ledger_id = make_hash(3), .amount = 77, .source_asset = make_hash(4)}};
  auto encoded = encoder.encode(tx);
  auto decoded = encoder.try_decode<crowdfund::schema::transaction_t>(
      bytes_view_t{encoded.data(), encoded.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->nonce, 42u);
  ASSERT_TRUE(std::holds_alternative<crowdfund::schema::contribute_t>(
      decoded->payload));
  const auto& payload = std::get<crowdfund::schema::contribute_t>(decoded->payload);
  EXPECT_EQ(payload.amount, amount_t{77});
  EXPECT_EQ(payload.ledger_id, make_hash(3));
}

TEST(encoding_types, truncated_transaction_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(crowdfund::schema::transaction_t{
      .chain_id = make_hash(1),
      .nonce = 1,
      .signer = make_hash(2),
      .payload = crowdfund::schema::refund_t{.ledger_id = make_hash(3)}});
  encoded.resize(encoded.size() - 5);
  EXPECT_FALSE(encoder.try_decode<crowdfund::schema::transaction_t>(
                          bytes_view_t{encoded.data(), encoded.size()})
                   .has_value());
}

TEST(encoding_types, error_codes_map_to_names_and_categories) {
  using crowdfund::schema::error_category;
  using crowdfund::schema::transaction_error_code;
  EXPECT_EQ(crowdfund::schema::to_string(transaction_error_code::target_exceeded),
            "target_exceeded");
  EXPECT_EQ(error_category(transaction_error_code::invalid_nonce), "envelope");
  EXPECT_EQ(error_category(transaction_error_code::invalid_window), "validation");
  EXPECT_EQ(error_category(transaction_error_code::unauthorized), "authorization");
  EXPECT_EQ(error_category(transaction_error_code::reentrant_call), "state");
  EXPECT_EQ(error_category(transaction_error_code::transfer_failed), "external");
}

TEST(encoding_types, event_types_round_trip_through_strings) {
  using crowdfund::schema::event_type_t;
  EXPECT_EQ(crowdfund::schema::to_string(event_type_t::refund_processed),
            "refund_processed");
  EXPECT_EQ(crowdfund::schema::try_from_string<event_type_t>("ledger_deployed"),
            std::optional<event_type_t>{event_type_t::ledger_deployed});
  EXPECT_FALSE(crowdfund::schema::try_from_string<event_type_t>("nope").has_value());
}
