#include <crowdfund/execution/engine.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/query_error_code.hpp>
#include <crowdfund/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using crowdfund::schema::amount_t;
using crowdfund::schema::bytes_view_t;
using crowdfund::schema::hash32_t;
using crowdfund::schema::transaction_error_code;
using crowdfund::testing::execution_fixture;
using crowdfund::testing::kDay;
using crowdfund::testing::make_account;

constexpr auto kT = crowdfund::schema::timestamp_milliseconds_t{1000 * kDay};
constexpr auto kStart = kT + kDay;
constexpr auto kEnd = kT + 10 * kDay;

const auto kSubmitter = make_account(0x01);
const auto kUser1 = make_account(0x11);
const auto kUser2 = make_account(0x12);
const auto kSourceAsset = crowdfund::testing::make_hash(0x30);

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

crowdfund::schema::submit_proposal_t make_submission() {
  return crowdfund::schema::submit_proposal_t{
      .min_target = 100, .max_target = 1000, .window_start = kStart, .window_end = kEnd};
}

crowdfund::schema::contribute_t make_contribution(const hash32_t& ledger_id,
                                                  const uint64_t amount) {
  return crowdfund::schema::contribute_t{
      .ledger_id = ledger_id, .amount = amount, .source_asset = kSourceAsset};
}

/// Submit and approve one proposal; returns the deployed ledger id.
hash32_t deploy_campaign(execution_fixture& fixture) {
  auto submitted = fixture.execute(kSubmitter, make_submission(), kT);
  EXPECT_EQ(submitted.code, 0u);
  auto proposal_id = fixture.encoder().decode<uint64_t>(
      bytes_view_t{submitted.data.data(), submitted.data.size()});
  auto reviewed = fixture.execute(
      execution_fixture::config().reviewer,
      crowdfund::schema::review_proposal_t{.proposal_id = proposal_id,
                                           .approve = true},
      kT + 1);
  EXPECT_EQ(reviewed.code, 0u);
  auto proposal = fixture.engine().registry().get_proposal(proposal_id);
  EXPECT_TRUE(proposal.has_value() && proposal->ledger_id.has_value());
  return proposal->ledger_id.value_or(hash32_t{});
}

template <typename T>
T decode_value(execution_fixture& fixture,
               const crowdfund::schema::query_result_t& result) {
  return fixture.encoder().decode<T>(
      bytes_view_t{result.value.data(), result.value.size()});
}

}  // namespace

TEST(engine_integration, submission_returns_sequential_proposal_id) {
  auto fixture = execution_fixture{"crowdfund_engine_submit"};
  auto first = fixture.execute(kSubmitter, make_submission(), kT);
  ASSERT_EQ(first.code, 0u);
  EXPECT_EQ(fixture.encoder().decode<uint64_t>(
                bytes_view_t{first.data.data(), first.data.size()}),
            0u);

  auto proposal = fixture.engine().registry().get_proposal(0);
  ASSERT_TRUE(proposal.has_value());
  EXPECT_EQ(proposal->status, crowdfund::schema::proposal_status_t::pending);
  EXPECT_EQ(proposal->created_at, kT);

  auto second = fixture.execute(kUser1, make_submission(), kT);
  ASSERT_EQ(second.code, 0u);
  EXPECT_EQ(fixture.encoder().decode<uint64_t>(
                bytes_view_t{second.data.data(), second.data.size()}),
            1u);
}

TEST(engine_integration, approval_deploys_ledger_with_derived_id) {
  auto fixture = execution_fixture{"crowdfund_engine_deploy"};
  auto ledger_id = deploy_campaign(fixture);
  EXPECT_EQ(ledger_id, fixture.engine().make_ledger_id(0));

  const auto* ledger = fixture.engine().ledger(ledger_id);
  ASSERT_NE(ledger, nullptr);
  EXPECT_EQ(ledger->state().terms.creator, kSubmitter);
  EXPECT_EQ(ledger->state().terms.min_target, amount_t{100});
  EXPECT_EQ(ledger->state().terms.max_target, amount_t{1000});
  EXPECT_EQ(ledger->state().terms.settlement_asset,
            execution_fixture::config().settlement_asset);
}

TEST(engine_integration, successful_campaign_is_claimed_once) {
  auto fixture = execution_fixture{"crowdfund_engine_claim"};
  auto ledger_id = deploy_campaign(fixture);

  EXPECT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 500), kStart + 1).code,
            0u);
  EXPECT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 600), kStart + 2).code,
            code_of(transaction_error_code::target_exceeded));
  EXPECT_EQ(fixture.engine().ledger(ledger_id)->state().total_collected,
            amount_t{500});

  auto claim = crowdfund::schema::claim_funds_t{.ledger_id = ledger_id};
  EXPECT_EQ(fixture.execute(kSubmitter, claim, kEnd).code,
            code_of(transaction_error_code::not_ended));
  EXPECT_EQ(fixture.execute(kSubmitter, claim, kEnd + 1).code, 0u);
  EXPECT_EQ(fixture.execute(kSubmitter, claim, kEnd + 2).code,
            code_of(transaction_error_code::already_claimed));

  const auto& transfers = fixture.transfers().transfers();
  ASSERT_EQ(transfers.size(), 2u);
  EXPECT_EQ(transfers.back().to, kSubmitter);
  EXPECT_EQ(transfers.back().amount, amount_t{500});
}

TEST(engine_integration, failed_campaign_is_refunded_per_contributor) {
  auto fixture = execution_fixture{"crowdfund_engine_refund"};
  auto ledger_id = deploy_campaign(fixture);

  ASSERT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 30), kStart).code,
            0u);
  ASSERT_EQ(fixture.execute(kUser2, make_contribution(ledger_id, 20), kStart).code,
            0u);

  auto refund = crowdfund::schema::refund_t{.ledger_id = ledger_id};
  EXPECT_EQ(fixture.execute(kUser1, refund, kEnd + 1).code, 0u);
  EXPECT_EQ(fixture.execute(kUser1, refund, kEnd + 1).code,
            code_of(transaction_error_code::no_contribution));
  EXPECT_EQ(fixture.execute(kSubmitter,
                            crowdfund::schema::claim_funds_t{.ledger_id = ledger_id},
                            kEnd + 1)
                .code,
            code_of(transaction_error_code::target_not_reached));
  EXPECT_EQ(fixture.execute(kUser2, refund, kEnd + 1).code, 0u);

  const auto* ledger = fixture.engine().ledger(ledger_id);
  EXPECT_EQ(ledger->state().total_collected, amount_t{0});
  EXPECT_TRUE(ledger->balances().empty());
  const auto& transfers = fixture.transfers().transfers();
  ASSERT_EQ(transfers.size(), 4u);
  EXPECT_EQ(transfers[2].to, kUser1);
  EXPECT_EQ(transfers[2].amount, amount_t{30});
  EXPECT_EQ(transfers[3].to, kUser2);
  EXPECT_EQ(transfers[3].amount, amount_t{20});
}

TEST(engine_integration, unknown_ledger_is_reported) {
  auto fixture = execution_fixture{"crowdfund_engine_unknown_ledger"};
  auto result = fixture.execute(
      kUser1, make_contribution(crowdfund::testing::make_hash(0x99), 5), kStart);
  EXPECT_EQ(result.code, code_of(transaction_error_code::unknown_ledger));
  EXPECT_EQ(result.codespace, "crowdfund.ledger");
}

TEST(engine_integration, envelope_is_checked_before_execution) {
  auto fixture = execution_fixture{"crowdfund_engine_envelope"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();

  auto garbage = crowdfund::schema::bytes_t{0xFF, 0x00, 0x01};
  EXPECT_EQ(engine.check_transaction(bytes_view_t{garbage.data(), garbage.size()}).code,
            code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(engine.check_transaction(bytes_view_t{}).code,
            code_of(transaction_error_code::invalid_transaction));

  auto tx = crowdfund::schema::transaction_t{
      .version = 1,
      .chain_id = execution_fixture::config().chain_id,
      .nonce = 1,
      .signer = kSubmitter,
      .payload = make_submission()};
  auto check = [&](const crowdfund::schema::transaction_t& value) {
    auto raw = encoder.encode(value);
    return engine.check_transaction(bytes_view_t{raw.data(), raw.size()});
  };
  auto admitted = check(tx);
  EXPECT_EQ(admitted.code, 0u);

  auto wrong_version = tx;
  wrong_version.version = 2;
  EXPECT_EQ(check(wrong_version).code,
            code_of(transaction_error_code::unsupported_transaction_version));

  auto wrong_chain = tx;
  wrong_chain.chain_id = crowdfund::testing::make_hash(0x01);
  EXPECT_EQ(check(wrong_chain).code,
            code_of(transaction_error_code::invalid_chain_id));

  auto wrong_nonce = tx;
  wrong_nonce.nonce = 2;
  auto rejected = check(wrong_nonce);
  EXPECT_EQ(rejected.code, code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(rejected.codespace, "crowdfund.checktx");

  auto null_signer = tx;
  null_signer.signer = crowdfund::schema::make_zero_hash();
  EXPECT_EQ(check(null_signer).code,
            code_of(transaction_error_code::invalid_transaction));

  // Admission never consumes the nonce.
  EXPECT_EQ(check(tx).code, 0u);
}

TEST(engine_integration, nonce_advances_only_on_success) {
  auto fixture = execution_fixture{"crowdfund_engine_nonce"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();
  auto make_raw = [&](const uint64_t nonce,
                      const crowdfund::schema::transaction_payload_t& payload) {
    return encoder.encode(crowdfund::schema::transaction_t{
        .version = 1,
        .chain_id = execution_fixture::config().chain_id,
        .nonce = nonce,
        .signer = kSubmitter,
        .payload = payload});
  };

  auto bad_terms = crowdfund::schema::submit_proposal_t{
      .min_target = 10, .max_target = 5, .window_start = kStart, .window_end = kEnd};
  auto block = engine.finalize_block(
      1, kT,
      {make_raw(1, bad_terms), make_raw(1, make_submission()),
       make_raw(2, make_submission()), make_raw(2, make_submission())});
  ASSERT_EQ(block.tx_results.size(), 4u);
  EXPECT_EQ(block.tx_results[0].code,
            code_of(transaction_error_code::invalid_amounts));
  EXPECT_EQ(block.tx_results[1].code, 0u);
  EXPECT_EQ(block.tx_results[2].code, 0u);
  EXPECT_EQ(block.tx_results[3].code,
            code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(block.tx_results[3].codespace, "crowdfund.finalize");
  EXPECT_EQ(engine.registry().proposal_count(), 2u);
}

TEST(engine_integration, state_root_is_deterministic) {
  auto first = execution_fixture{"crowdfund_engine_root_a"};
  auto second = execution_fixture{"crowdfund_engine_root_b"};
  auto raw_a = first.make_tx(kSubmitter, make_submission());
  auto raw_b = second.make_tx(kSubmitter, make_submission());
  ASSERT_EQ(raw_a, raw_b);

  auto block_a = first.engine().finalize_block(1, kT, {raw_a});
  auto block_b = second.engine().finalize_block(1, kT, {raw_b});
  EXPECT_EQ(block_a.state_root, block_b.state_root);
  EXPECT_NE(block_a.state_root, crowdfund::schema::make_zero_hash());

  auto committed = first.engine().commit();
  EXPECT_EQ(committed.committed_height, 1);
  EXPECT_EQ(committed.state_root, block_a.state_root);
  EXPECT_EQ(first.engine().info().last_block_state_root, block_a.state_root);
  EXPECT_EQ(committed.events_persisted, 1u);
  EXPECT_EQ(block_a.events_emitted, 1u);
  ASSERT_EQ(block_a.tx_results.front().event_ids.size(), 1u);
  EXPECT_EQ(block_a.tx_results.front().event_ids.front(), 1u);

  auto info = first.engine().info();
  EXPECT_EQ(info.name, "crowdfund-ledger");
  EXPECT_EQ(info.chain_id, execution_fixture::config().chain_id);
  EXPECT_EQ(info.proposal_count, 1u);
  EXPECT_EQ(info.ledger_count, 0u);
}

TEST(engine_integration, events_get_sequential_ids) {
  auto fixture = execution_fixture{"crowdfund_engine_events"};
  auto ledger_id = deploy_campaign(fixture);
  ASSERT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 200), kStart).code,
            0u);

  auto records = fixture.engine().events(1, 100);
  ASSERT_EQ(records.size(), 4u);
  EXPECT_EQ(records[0].event.type, "proposal_submitted");
  EXPECT_EQ(records[1].event.type, "ledger_deployed");
  EXPECT_EQ(records[2].event.type, "proposal_reviewed");
  EXPECT_EQ(records[3].event.type, "contribution_recorded");
  for (size_t i = 0; i < records.size(); ++i) {
    EXPECT_EQ(records[i].event_id, i + 1);
  }
  EXPECT_EQ(records[3].height, fixture.height());

  auto encoder = crowdfund::testing::scale_encoder_t{};
  auto range = encoder.encode(std::tuple{uint64_t{2}, uint64_t{3}});
  auto query =
      fixture.engine().query("/events/range", bytes_view_t{range.data(), range.size()});
  ASSERT_EQ(query.code, 0u);
  auto window =
      decode_value<std::vector<crowdfund::schema::event_record_t>>(fixture, query);
  ASSERT_EQ(window.size(), 2u);
  EXPECT_EQ(window.front().event_id, 2u);
}

TEST(engine_integration, queries_expose_registry_and_ledgers) {
  auto fixture = execution_fixture{"crowdfund_engine_query"};
  auto ledger_id = deploy_campaign(fixture);
  ASSERT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 150), kStart).code,
            0u);
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();

  auto reviewer = engine.query("/state/reviewer", {});
  ASSERT_EQ(reviewer.code, 0u);
  EXPECT_EQ(decode_value<hash32_t>(fixture, reviewer),
            execution_fixture::config().reviewer);

  auto proposal_key = encoder.encode(uint64_t{0});
  auto proposal = engine.query(
      "/state/proposal", bytes_view_t{proposal_key.data(), proposal_key.size()});
  ASSERT_EQ(proposal.code, 0u);
  EXPECT_EQ(decode_value<crowdfund::schema::proposal_state_t>(fixture, proposal)
                .ledger_id,
            std::optional<hash32_t>{ledger_id});

  auto missing_key = encoder.encode(uint64_t{9});
  auto missing = engine.query(
      "/state/proposal", bytes_view_t{missing_key.data(), missing_key.size()});
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(crowdfund::schema::query_error_code::not_found));
  EXPECT_EQ(missing.codespace, "crowdfund.query");
  EXPECT_EQ(missing.info, "not_found");
  EXPECT_EQ(missing.path, "/state/proposal");

  auto history = engine.query(
      "/state/submitter_history", bytes_view_t{kSubmitter.data(), kSubmitter.size()});
  ASSERT_EQ(history.code, 0u);
  EXPECT_EQ(decode_value<std::vector<uint64_t>>(fixture, history),
            (std::vector<uint64_t>{0}));

  auto ledger = engine.query("/state/ledger",
                             bytes_view_t{ledger_id.data(), ledger_id.size()});
  ASSERT_EQ(ledger.code, 0u);
  auto details = decode_value<crowdfund::schema::ledger_details_t>(fixture, ledger);
  EXPECT_TRUE(details.is_active);
  EXPECT_TRUE(details.is_successful);
  EXPECT_EQ(details.state.total_collected, amount_t{150});

  auto balance_key = encoder.encode(std::tuple{ledger_id, kUser1});
  auto balance = engine.query(
      "/state/balance", bytes_view_t{balance_key.data(), balance_key.size()});
  ASSERT_EQ(balance.code, 0u);
  EXPECT_EQ(crowdfund::schema::from_amount_bytes(decode_value<hash32_t>(fixture, balance)),
            amount_t{150});

  auto short_key = crowdfund::schema::bytes_t{0x01, 0x02};
  EXPECT_EQ(engine.query("/state/ledger", bytes_view_t{short_key.data(), short_key.size()})
                .code,
            static_cast<uint32_t>(crowdfund::schema::query_error_code::invalid_key));
  EXPECT_EQ(engine.query("/state/unknown", {}).code,
            static_cast<uint32_t>(
                crowdfund::schema::query_error_code::unsupported_path));
}

TEST(engine_integration, committed_state_survives_reopen) {
  auto fixture = execution_fixture{"crowdfund_engine_reopen"};
  auto ledger_id = deploy_campaign(fixture);
  ASSERT_EQ(fixture.execute(kUser1, make_contribution(ledger_id, 40), kStart).code,
            0u);
  ASSERT_EQ(fixture
                .execute(execution_fixture::config().reviewer,
                         crowdfund::schema::transfer_reviewer_role_t{
                             .new_reviewer = make_account(0xAB)},
                         kStart)
                .code,
            0u);
  auto before = fixture.engine().info();

  fixture.reopen();
  auto& engine = fixture.engine();
  auto after = engine.info();
  EXPECT_EQ(after.last_block_height, before.last_block_height);
  EXPECT_EQ(after.last_block_state_root, before.last_block_state_root);
  EXPECT_EQ(engine.registry().reviewer(), make_account(0xAB));
  EXPECT_EQ(engine.registry().proposal_count(), 1u);

  const auto* ledger = engine.ledger(ledger_id);
  ASSERT_NE(ledger, nullptr);
  EXPECT_EQ(ledger->balance_of(kUser1), amount_t{40});
  EXPECT_EQ(ledger->state().total_collected, amount_t{40});
  EXPECT_EQ(engine.events(1, 100).size(), 5u);

  // Nonces and the event sequence continue where they stopped.
  auto refund = fixture.execute(
      kUser1, crowdfund::schema::refund_t{.ledger_id = ledger_id}, kEnd + 1);
  EXPECT_EQ(refund.code, 0u);
  auto records = engine.events(6, 6);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records.front().event.type, "refund_processed");
}

TEST(engine_integration, persisted_settlement_asset_wins_on_reopen) {
  auto fixture = execution_fixture{"crowdfund_engine_asset"};
  const auto persisted = execution_fixture::config().settlement_asset;
  (void)deploy_campaign(fixture);

  auto changed = execution_fixture::config();
  changed.settlement_asset = crowdfund::testing::make_hash(0x51);
  fixture.reopen(changed);
  EXPECT_EQ(fixture.engine().registry().settlement_asset(), persisted);

  auto ledger_id = deploy_campaign(fixture);
  const auto* ledger = fixture.engine().ledger(ledger_id);
  ASSERT_NE(ledger, nullptr);
  EXPECT_EQ(ledger->state().terms.settlement_asset, persisted);

  // The commits above must not have replaced the stored asset either.
  changed.settlement_asset = crowdfund::testing::make_hash(0x52);
  fixture.reopen(changed);
  EXPECT_EQ(fixture.engine().registry().settlement_asset(), persisted);
}
