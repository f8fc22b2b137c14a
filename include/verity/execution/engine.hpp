#pragma once

#include <verity/execution/signature_verifier.hpp>
#include <verity/registry/state_context.hpp>
#include <verity/schema/app_info.hpp>
#include <verity/schema/block_result.hpp>
#include <verity/schema/commit_result.hpp>
#include <verity/schema/encoding/encoder.hpp>
#include <verity/schema/genesis.hpp>
#include <verity/schema/history_entry.hpp>
#include <verity/schema/primitives.hpp>
#include <verity/schema/query_result.hpp>
#include <verity/schema/replay_result.hpp>
#include <verity/schema/transaction.hpp>
#include <verity/schema/transaction_error_code.hpp>
#include <verity/schema/transaction_result.hpp>
#include <verity/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verity::execution {

/// Deterministic identity and credential registry state machine.
///
/// The engine validates transaction envelopes, executes registry operations
/// with all-or-nothing semantics, persists state, history and audit events,
/// and exposes query, backup and replay interfaces. It is driven in-process by
/// whatever delivers ordered blocks (the node CLI, tests).
class engine final {
 public:
  /// Construct the engine with encoder/storage backends and runtime options.
  ///
  /// `require_strict_crypto` enables real signature verification; when false,
  /// signatures are bypassed for development chains.
  explicit engine(
      verity::schema::encoding::encoder<
          verity::schema::encoding::scale_encoder_tag>& encoder,
      verity::storage::storage<verity::storage::rocksdb_storage_tag>& storage,
      bool require_strict_crypto = true);

  /// Bring the registry up: fix the admin and persist genesis. Runs once.
  verity::schema::transaction_result_t init_chain(
      const verity::schema::genesis_t& genesis);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + envelope validation only; does not mutate state.
  verity::schema::transaction_result_t check_transaction(
      const verity::schema::bytes_view_t& raw_tx);

  /// Execute a block and compute its resulting state_root.
  ///
  /// Transactions are processed in order; each one commits atomically or
  /// leaves no state behind. Per-tx results are returned even on failures.
  verity::schema::block_result_t finalize_block(
      uint64_t height,
      verity::schema::timestamp_seconds_t block_time,
      const std::vector<verity::schema::bytes_t>& txs);

  /// Persist the latest finalized height and state_root as the checkpoint.
  verity::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  verity::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  verity::schema::query_result_t query(
      std::string_view path,
      const verity::schema::bytes_view_t& data);

  /// Return history entries in the inclusive height range, in execution
  /// order.
  std::vector<verity::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Export backup bytes to filesystem path.
  bool export_backup(std::string_view backup_path) const;

  /// Export backup bytes as in-memory payload.
  verity::schema::bytes_t export_backup() const;

  /// Load backup bytes from filesystem path and replace persisted state.
  bool load_backup(std::string_view backup_path);

  /// Load backup bytes from memory and replace persisted state.
  ///
  /// On failure, `error` contains a human-readable reason.
  bool load_backup(const verity::schema::bytes_view_t& backup,
                   std::string& error);

  /// Re-run persisted history from genesis in scratch storage and check
  /// result codes and state-root agreement.
  verity::schema::replay_result_t replay_history();

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Validate envelope: version, chain id, registry initialized, nonce, and
  /// signature.
  std::optional<verity::schema::transaction_result_t> validate_transaction(
      const verity::schema::transaction_t& tx,
      std::string_view codespace,
      const verity::registry::state_context& state) const;

  /// Decode, validate, and execute one transaction against `state`.
  verity::schema::transaction_result_t execute_transaction(
      const verity::schema::bytes_view_t& raw_tx,
      verity::registry::state_context& state);

  /// Run the payload operation against the registry components.
  verity::schema::transaction_result_t execute_operation(
      const verity::schema::transaction_t& tx,
      verity::registry::state_context& state);

  verity::schema::bytes_t export_backup_locked() const;
  std::vector<verity::schema::history_entry_t> history_locked(
      uint64_t from_height,
      uint64_t to_height) const;

  /// Load committed state and genesis from storage.
  void load_persisted_state();

  mutable std::mutex mutex_;
  verity::schema::encoding::encoder<
      verity::schema::encoding::scale_encoder_tag>& encoder_;
  verity::storage::storage<verity::storage::rocksdb_storage_tag>& storage_;
  int64_t last_committed_height_{};
  verity::schema::hash32_t last_committed_state_root_;
  verity::schema::timestamp_seconds_t last_block_time_{};
  int64_t pending_height_{};
  verity::schema::hash32_t pending_state_root_;
  verity::schema::timestamp_seconds_t pending_block_time_{};
  verity::schema::hash32_t chain_id_;
  std::optional<verity::schema::genesis_t> genesis_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace verity::execution
