#pragma once

#include <crowdfund/execution/asset_transfer.hpp>
#include <crowdfund/execution/campaign_ledger.hpp>
#include <crowdfund/execution/campaign_registry.hpp>
#include <crowdfund/execution/engine_config.hpp>
#include <crowdfund/schema/app_info.hpp>
#include <crowdfund/schema/block_result.hpp>
#include <crowdfund/schema/encoding/encoder.hpp>
#include <crowdfund/schema/event_record.hpp>
#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/query_result.hpp>
#include <crowdfund/schema/transaction.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <crowdfund/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace crowdfund::execution {

/// Deterministic host for the registry and every deployed ledger.
///
/// The engine decodes transactions, supplies the signer as caller and the
/// block time as clock, folds a rolling state root over successful
/// transactions, and persists all state on commit.
class engine final {
 public:
  /// Load committed state from `storage`, or seed the registry from `config`
  /// when the database is empty.
  explicit engine(
      crowdfund::schema::encoding::scale_encoder_t& encoder,
      crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
          storage,
      engine_config config,
      asset_transfer_t transfer);

  /// Decode and envelope checks only; never mutates state.
  crowdfund::schema::transaction_result_t check_transaction(
      const crowdfund::schema::bytes_view_t& raw_tx);

  /// Execute a block in order. Per-tx results are returned even on failures.
  crowdfund::schema::block_result_t finalize_block(
      uint64_t height,
      crowdfund::schema::timestamp_milliseconds_t block_time_ms,
      const std::vector<crowdfund::schema::bytes_t>& txs);

  /// Persist state rows, pending events and the checkpoint.
  crowdfund::schema::commit_result_t commit();

  crowdfund::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  crowdfund::schema::query_result_t query(
      std::string_view path,
      const crowdfund::schema::bytes_view_t& data);

  /// Event records with ids in [from_id, to_id], committed or pending.
  std::vector<crowdfund::schema::event_record_t> events(uint64_t from_id,
                                                        uint64_t to_id) const;

  const campaign_registry& registry() const { return registry_; }

  /// nullptr when no ledger with this id was deployed.
  const campaign_ledger* ledger(
      const crowdfund::schema::hash32_t& ledger_id) const;

  /// Ledger id for a proposal: blake3(chain_id | "LEDGER" | proposal_id).
  crowdfund::schema::hash32_t make_ledger_id(uint64_t proposal_id) const;

 private:
  crowdfund::schema::transaction_result_t execute_operation(
      const crowdfund::schema::transaction_t& tx,
      crowdfund::schema::timestamp_milliseconds_t now);

  /// Envelope checks: version, signer, chain id and next nonce.
  crowdfund::schema::transaction_result_t validate_transaction(
      const crowdfund::schema::transaction_t& tx,
      std::string_view codespace) const;

  crowdfund::schema::hash32_t deploy_ledger(
      uint64_t proposal_id,
      const crowdfund::schema::ledger_terms_t& terms);

  std::vector<crowdfund::storage::key_value_entry_t> state_rows();
  std::vector<crowdfund::schema::event_record_t> events_locked(
      uint64_t from_id,
      uint64_t to_id) const;
  void load_persisted_state();

  mutable std::mutex mutex_;
  crowdfund::schema::encoding::scale_encoder_t& encoder_;
  crowdfund::storage::storage<crowdfund::storage::rocksdb_storage_tag>&
      storage_;
  engine_config config_;
  asset_transfer_t transfer_;
  campaign_registry registry_;
  std::map<crowdfund::schema::hash32_t, std::unique_ptr<campaign_ledger>>
      ledgers_;
  std::map<crowdfund::schema::account_id_t, uint64_t> nonces_;
  std::vector<crowdfund::schema::event_record_t> pending_events_;
  uint64_t next_event_id_{1};
  int64_t last_committed_height_{};
  crowdfund::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  crowdfund::schema::hash32_t pending_state_root_{};
  crowdfund::schema::timestamp_milliseconds_t current_block_time_ms_{};
};

}  // namespace crowdfund::execution
