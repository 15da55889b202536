#include <spdlog/spdlog.h>
#include <algorithm>
#include <crowdfund/blake3/hash.hpp>
#include <crowdfund/common/critical.hpp>
#include <crowdfund/execution/engine.hpp>
#include <crowdfund/execution/events.hpp>
#include <crowdfund/schema/encoding/scale/encoder.hpp>
#include <crowdfund/schema/key/engine_keys.hpp>
#include <crowdfund/schema/query_error_code.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace crowdfund::schema;

namespace {

using encoder_t = crowdfund::schema::encoding::scale_encoder_t;

inline constexpr auto kCheckTxCodespace = std::string_view{"crowdfund.checktx"};
inline constexpr auto kFinalizeCodespace =
    std::string_view{"crowdfund.finalize"};
inline constexpr auto kQueryCodespace = std::string_view{"crowdfund.query"};
inline constexpr auto kLedgerDomain = std::string_view{"LEDGER"};
inline constexpr uint64_t kMaxEventRange = 1000;

hash32_t fold_state_root(encoder_t& encoder,
                         const hash32_t& seed,
                         const bytes_t& tx,
                         const uint64_t height,
                         const uint64_t index) {
  auto suffix = encoder.encode(std::tuple{height, index});
  return crowdfund::blake3::hash({bytes_view_t{seed.data(), seed.size()},
                                  bytes_view_t{tx.data(), tx.size()},
                                  bytes_view_t{suffix.data(), suffix.size()}});
}

std::optional<transaction_t> decode_transaction(encoder_t& encoder,
                                                const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return std::nullopt;
  }
  return encoder.try_decode<transaction_t>(raw_tx);
}

}  // namespace

namespace crowdfund::execution {

engine::engine(encoder_t& encoder,
               crowdfund::storage::storage<
                   crowdfund::storage::rocksdb_storage_tag>& storage,
               engine_config config,
               asset_transfer_t transfer)
    : encoder_{encoder},
      storage_{storage},
      config_{std::move(config)},
      transfer_{std::move(transfer)},
      registry_{config_.reviewer, config_.settlement_asset,
                [this](const uint64_t proposal_id,
                       const ledger_terms_t& terms) {
                  return deploy_ledger(proposal_id, terms);
                }} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing crowdfund engine for chain {}",
               to_hex(config_.chain_id));
  if (is_null_identity(config_.reviewer)) {
    crowdfund::common::critical("engine requires a non-null reviewer");
  }
  if (is_null_identity(config_.settlement_asset)) {
    crowdfund::common::critical("engine requires a non-null settlement asset");
  }
  if (!transfer_) {
    spdlog::warn("No asset transfer capability; every transfer will fail");
  }

  load_persisted_state();
  if (!storage_.load_committed_state()) {
    last_committed_state_root_ = make_zero_hash();
    pending_state_root_ = last_committed_state_root_;
    storage_.save_committed_state(crowdfund::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  }
  spdlog::info("Crowdfund engine ready at height {} with {} proposal(s), {} "
               "ledger(s)",
               last_committed_height_, registry_.proposal_count(),
               ledgers_.size());
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = decode_transaction(encoder_, raw_tx);
  if (!tx) {
    return make_failure(transaction_error_code::invalid_transaction,
                        kCheckTxCodespace, "invalid transaction");
  }
  auto result = validate_transaction(*tx, kCheckTxCodespace);
  if (result.code == 0) {
    result.info = "transaction admitted";
  }
  return result;
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_milliseconds_t block_time_ms,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  current_block_time_ms_ = block_time_ms;
  auto result = block_result_t{};
  result.height = height;
  result.block_time = block_time_ms;
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto tx = decode_transaction(encoder_,
                                 bytes_view_t{txs[i].data(), txs[i].size()});
    if (!tx) {
      result.tx_results.push_back(
          make_failure(transaction_error_code::invalid_transaction,
                       kFinalizeCodespace, "invalid transaction"));
      continue;
    }
    auto validation = validate_transaction(*tx, kFinalizeCodespace);
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    auto tx_result = execute_operation(*tx, block_time_ms);
    if (tx_result.code == 0) {
      nonces_[tx->signer] = tx->nonce;
      rolling_root = fold_state_root(encoder_, rolling_root, txs[i], height, i);
      for (const auto& event : tx_result.events) {
        tx_result.event_ids.push_back(next_event_id_);
        pending_events_.push_back(
            event_record_t{.event_id = next_event_id_++,
                           .height = height,
                           .tx_index = static_cast<uint32_t>(i),
                           .event = event});
      }
      result.events_emitted += tx_result.events.size();
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  for (const auto& record : pending_events_) {
    auto key = crowdfund::schema::key::make_event_key(record.event_id);
    storage_.put(encoder_, bytes_view_t{key.data(), key.size()}, record);
  }
  storage_.replace_by_prefix(
      make_bytes_view(crowdfund::schema::key::kStatePrefix), state_rows());
  storage_.save_committed_state(crowdfund::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
  const auto persisted = static_cast<uint64_t>(pending_events_.size());
  spdlog::info("Committed height {} with {} new event(s)",
               last_committed_height_, persisted);
  pending_events_.clear();

  return commit_result_t{.committed_height = last_committed_height_,
                         .state_root = last_committed_state_root_,
                         .events_persisted = persisted};
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.chain_id = config_.chain_id;
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.proposal_count = registry_.proposal_count();
  result.ledger_count = ledgers_.size();
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.path = std::string{path};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto fail = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    result.info = std::string{to_string(code)};
    return result;
  };
  auto read_hash = [&]() -> std::optional<hash32_t> {
    if (data.size() != hash32_t{}.size()) {
      return std::nullopt;
    }
    auto value = hash32_t{};
    std::copy(std::begin(data), std::end(data), std::begin(value));
    return value;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, config_.chain_id});
    return result;
  }
  if (path == "/state/reviewer") {
    result.value = encoder_.encode(registry_.reviewer());
    return result;
  }
  if (path == "/state/proposal") {
    auto proposal_id = encoder_.try_decode<uint64_t>(data);
    if (!proposal_id) {
      return fail(query_error_code::invalid_key, "expected SCALE uint64 id");
    }
    auto proposal = registry_.get_proposal(*proposal_id);
    if (!proposal) {
      return fail(query_error_code::not_found, "unknown proposal");
    }
    result.value = encoder_.encode(*proposal);
    return result;
  }
  if (path == "/state/submitter_history") {
    auto submitter = read_hash();
    if (!submitter) {
      return fail(query_error_code::invalid_key, "expected 32-byte account");
    }
    result.value = encoder_.encode(registry_.get_submitter_history(*submitter));
    return result;
  }
  if (path == "/state/ledger") {
    auto ledger_id = read_hash();
    if (!ledger_id) {
      return fail(query_error_code::invalid_key, "expected 32-byte ledger id");
    }
    auto found = ledgers_.find(*ledger_id);
    if (found == std::end(ledgers_)) {
      return fail(query_error_code::not_found, "unknown ledger");
    }
    result.value =
        encoder_.encode(found->second->get_details(current_block_time_ms_));
    return result;
  }
  if (path == "/state/balance") {
    auto key = encoder_.try_decode<std::tuple<hash32_t, account_id_t>>(data);
    if (!key) {
      return fail(query_error_code::invalid_key,
                  "expected SCALE (ledger_id, account)");
    }
    auto found = ledgers_.find(std::get<0>(*key));
    if (found == std::end(ledgers_)) {
      return fail(query_error_code::not_found, "unknown ledger");
    }
    result.value = encoder_.encode(
        to_amount_bytes(found->second->balance_of(std::get<1>(*key))));
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key,
                  "expected SCALE (from_id, to_id)");
    }
    const auto [from_id, to_id] = *range;
    if (from_id > to_id || to_id - from_id >= kMaxEventRange) {
      return fail(query_error_code::invalid_key,
                  "event range is empty or too large");
    }
    result.value = encoder_.encode(events_locked(from_id, to_id));
    return result;
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return fail(query_error_code::unsupported_path, "unsupported query path");
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return events_locked(from_id, to_id);
}

const campaign_ledger* engine::ledger(const hash32_t& ledger_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = ledgers_.find(ledger_id);
  if (found == std::end(ledgers_)) {
    return nullptr;
  }
  return found->second.get();
}

hash32_t engine::make_ledger_id(const uint64_t proposal_id) const {
  auto encoded_id = encoder_.encode(proposal_id);
  return crowdfund::blake3::hash(
      {bytes_view_t{config_.chain_id.data(), config_.chain_id.size()},
       make_bytes_view(kLedgerDomain),
       bytes_view_t{encoded_id.data(), encoded_id.size()}});
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const timestamp_milliseconds_t now) {
  const auto context = call_context{.caller = tx.signer, .now = now};
  auto with_ledger = [&](const hash32_t& ledger_id, auto&& operation) {
    auto found = ledgers_.find(ledger_id);
    if (found == std::end(ledgers_)) {
      return make_failure(transaction_error_code::unknown_ledger,
                          kLedgerCodespace,
                          "no ledger with id " + to_hex(ledger_id));
    }
    return operation(*found->second);
  };

  return std::visit(
      overloaded{
          [&](const submit_proposal_t& operation) {
            auto result = registry_.submit(context, operation);
            if (result.code == 0) {
              result.data = encoder_.encode(registry_.proposal_count() - 1);
            }
            return result;
          },
          [&](const review_proposal_t& operation) {
            return registry_.review(context, operation);
          },
          [&](const transfer_reviewer_role_t& operation) {
            return registry_.transfer_reviewer_role(context, operation);
          },
          [&](const contribute_t& operation) {
            return with_ledger(operation.ledger_id,
                               [&](campaign_ledger& target) {
                                 return target.contribute(context, operation);
                               });
          },
          [&](const claim_funds_t& operation) {
            return with_ledger(operation.ledger_id,
                               [&](campaign_ledger& target) {
                                 return target.claim_funds(context);
                               });
          },
          [&](const refund_t& operation) {
            return with_ledger(operation.ledger_id,
                               [&](campaign_ledger& target) {
                                 return target.refund(context);
                               });
          }},
      tx.payload);
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_failure(transaction_error_code::unsupported_transaction_version,
                        codespace, "expected transaction version 1");
  }
  if (is_null_identity(tx.signer)) {
    return make_failure(transaction_error_code::invalid_transaction, codespace,
                        "signer must not be null");
  }
  if (tx.chain_id != config_.chain_id) {
    return make_failure(transaction_error_code::invalid_chain_id, codespace,
                        "transaction is for a different chain");
  }
  auto found = nonces_.find(tx.signer);
  const auto expected = (found == std::end(nonces_) ? 0 : found->second) + 1;
  if (tx.nonce != expected) {
    return make_failure(transaction_error_code::invalid_nonce, codespace,
                        "expected nonce " + std::to_string(expected));
  }
  return transaction_result_t{};
}

hash32_t engine::deploy_ledger(const uint64_t proposal_id,
                               const ledger_terms_t& terms) {
  auto ledger_id = make_ledger_id(proposal_id);
  auto [it, inserted] = ledgers_.emplace(
      ledger_id, std::make_unique<campaign_ledger>(ledger_id, proposal_id,
                                                   terms, transfer_));
  (void)it;
  if (!inserted) {
    crowdfund::common::critical("ledger {} already deployed",
                                to_hex(ledger_id));
  }
  return ledger_id;
}

std::vector<crowdfund::storage::key_value_entry_t> engine::state_rows() {
  namespace key = crowdfund::schema::key;
  auto rows = std::vector<crowdfund::storage::key_value_entry_t>{};
  rows.emplace_back(key::make_registry_key(),
                    encoder_.encode(std::tuple{registry_.reviewer(),
                                               registry_.settlement_asset()}));
  for (const auto& proposal : registry_.proposals()) {
    rows.emplace_back(key::make_proposal_key(proposal.proposal_id),
                      encoder_.encode(proposal));
  }
  for (const auto& [ledger_id, ledger] : ledgers_) {
    rows.emplace_back(key::make_ledger_key(ledger_id),
                      encoder_.encode(ledger->state()));
    for (const auto& [account, balance] : ledger->balances()) {
      rows.emplace_back(key::make_balance_key(ledger_id, account),
                        encoder_.encode(to_amount_bytes(balance)));
    }
  }
  for (const auto& [signer, nonce] : nonces_) {
    rows.emplace_back(key::make_nonce_key(signer), encoder_.encode(nonce));
  }
  rows.emplace_back(key::make_event_sequence_key(),
                    encoder_.encode(
                        std::tuple{next_event_id_, current_block_time_ms_}));
  return rows;
}

std::vector<event_record_t> engine::events_locked(const uint64_t from_id,
                                                  uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  if (next_event_id_ <= 1) {
    return records;
  }
  to_id = std::min(to_id, next_event_id_ - 1);
  const auto first_pending = pending_events_.empty()
                                 ? next_event_id_
                                 : pending_events_.front().event_id;
  for (auto id = std::max<uint64_t>(from_id, 1); id <= to_id; ++id) {
    if (id >= first_pending) {
      records.push_back(pending_events_[id - first_pending]);
      continue;
    }
    auto key = crowdfund::schema::key::make_event_key(id);
    auto record = storage_.get<event_record_t>(
        encoder_, bytes_view_t{key.data(), key.size()});
    if (record) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

void engine::load_persisted_state() {
  namespace key = crowdfund::schema::key;
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }

  auto registry_key = key::make_registry_key();
  auto registry_row = storage_.get<std::tuple<account_id_t, asset_id_t>>(
      encoder_, bytes_view_t{registry_key.data(), registry_key.size()});
  if (!registry_row) {
    spdlog::info("No persisted registry; starting with reviewer {}",
                 to_hex(config_.reviewer));
    return;
  }
  if (std::get<1>(*registry_row) != config_.settlement_asset) {
    spdlog::warn("Persisted settlement asset {} overrides configured {}",
                 to_hex(std::get<1>(*registry_row)),
                 to_hex(config_.settlement_asset));
  }

  auto proposals = std::vector<proposal_state_t>{};
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kProposalKeyPrefix))) {
    (void)row_key;
    proposals.push_back(encoder_.decode<proposal_state_t>(
        bytes_view_t{value.data(), value.size()}));
  }
  registry_.restore(std::get<0>(*registry_row), std::get<1>(*registry_row),
                    std::move(proposals));

  auto balances = std::map<hash32_t, std::map<account_id_t, amount_t>>{};
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kBalanceKeyPrefix))) {
    auto parsed = key::parse_balance_key(
        bytes_view_t{row_key.data(), row_key.size()});
    if (!parsed) {
      crowdfund::common::critical("malformed balance key in storage");
    }
    balances[parsed->first][parsed->second] = from_amount_bytes(
        encoder_.decode<hash32_t>(bytes_view_t{value.data(), value.size()}));
  }

  ledgers_.clear();
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kLedgerKeyPrefix))) {
    (void)row_key;
    auto state = encoder_.decode<ledger_state_t>(
        bytes_view_t{value.data(), value.size()});
    const auto ledger_id = state.ledger_id;
    auto ledger_balances = std::move(balances[ledger_id]);
    ledgers_.emplace(ledger_id, std::make_unique<campaign_ledger>(
                                    std::move(state),
                                    std::move(ledger_balances), transfer_));
  }

  nonces_.clear();
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kNonceKeyPrefix))) {
    auto signer =
        key::parse_nonce_key(bytes_view_t{row_key.data(), row_key.size()});
    if (!signer) {
      crowdfund::common::critical("malformed nonce key in storage");
    }
    nonces_[*signer] =
        encoder_.decode<uint64_t>(bytes_view_t{value.data(), value.size()});
  }

  auto sequence_key = key::make_event_sequence_key();
  if (auto sequence = storage_.get<std::tuple<uint64_t, uint64_t>>(
          encoder_, bytes_view_t{sequence_key.data(), sequence_key.size()})) {
    next_event_id_ = std::get<0>(*sequence);
    current_block_time_ms_ = std::get<1>(*sequence);
  }
}

}  // namespace crowdfund::execution
