#pragma once

#include <notary/execution/signature_verifier.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/app_info.hpp>
#include <notary/schema/block_result.hpp>
#include <notary/schema/commit_result.hpp>
#include <notary/schema/encoding/encoder.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/history_entry.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/query_result.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notary::execution {

/// Deterministic approval ledger state machine used by the node service.
///
/// The engine validates signed transactions, runs admin and approval registry
/// transitions, stages state/history per block, and serves read-only queries
/// over committed state.
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  ///
  /// `chain_id` is pinned in storage on first start; reopening a store with a
  /// different chain id is fatal. `require_strict_crypto` enables ed25519
  /// signature verification; when false, signatures are not checked.
  explicit engine(
      notary::schema::encoding::encoder<
          notary::schema::encoding::scale_encoder_tag>& encoder,
      notary::storage::storage<notary::storage::rocksdb_storage_tag>& storage,
      const notary::schema::hash32_t& chain_id,
      bool require_strict_crypto = true);

  /// Admit a transaction for inclusion. Decodes and validates the envelope
  /// against committed plus staged state; never mutates state.
  notary::schema::transaction_result_t check_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state_root.
  ///
  /// Transactions are processed in-order; per-tx results are returned even on
  /// failures. Any block staged but not committed is discarded first.
  notary::schema::block_result_t finalize_block(
      uint64_t height,
      notary::schema::timestamp_seconds_t block_time,
      const std::vector<notary::schema::bytes_t>& txs);

  /// Atomically persist the staged block, its history and the new checkpoint.
  notary::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  notary::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  notary::schema::query_result_t query(
      std::string_view path,
      const notary::schema::bytes_view_t& data);

  /// Return committed history entries in the inclusive height range.
  std::vector<notary::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const notary::schema::hash32_t& chain_id() const;

 private:
  /// Validate version, chain id, nonce and signature against `view`.
  notary::schema::transaction_result_t validate_transaction(
      const notary::schema::transaction_t& tx,
      std::string_view codespace,
      const state_view& view);

  /// Run the payload's registry transition; writes land in `view`.
  notary::schema::transaction_result_t execute_operation(
      const notary::schema::transaction_t& tx,
      notary::schema::timestamp_seconds_t block_time,
      state_view& view);

  uint64_t next_nonce(const notary::schema::account_id_t& signer,
                      const state_view& view);

  std::vector<notary::schema::history_entry_t> history_locked(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Load committed checkpoint and pin the chain id at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>& encoder_;
  notary::storage::storage<notary::storage::rocksdb_storage_tag>& storage_;
  notary::schema::hash32_t chain_id_;
  int64_t last_committed_height_{};
  notary::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  notary::schema::hash32_t pending_state_root_{};
  write_set_t pending_writes_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace notary::execution
