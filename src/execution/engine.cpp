#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <tuple>
#include <utility>
#include <verity/blake3/hash.hpp>
#include <verity/crypto/verify.hpp>
#include <verity/execution/engine.hpp>
#include <verity/execution/signing.hpp>
#include <verity/registry/components.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/schema/key/engine_keys.hpp>
#include <verity/schema/query_error_code.hpp>

using namespace verity::schema;

namespace {

using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;
using backup_rows_t = std::vector<verity::storage::key_value_entry_t>;
using backup_checkpoint_t = std::tuple<int64_t, hash32_t, timestamp_seconds_t>;
using backup_t = std::tuple<uint16_t,
                            std::optional<backup_checkpoint_t>,
                            backup_rows_t,
                            backup_rows_t,
                            backup_rows_t,
                            std::optional<genesis_t>,
                            hash32_t>;

constexpr auto kBackupFormatVersion = uint16_t{1};
constexpr auto kCheckTxCodespace = std::string_view{"verity.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"verity.finalize"};
constexpr auto kQueryCodespace = std::string_view{"verity.query"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  return verity::blake3::hasher{}
      .update(bytes_view_t{seed})
      .update(bytes_view_t{tx})
      .update(bytes_view_t{encoded_suffix})
      .finalize();
}

transaction_result_t make_error_result(transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

bool rows_within(const backup_rows_t& rows, std::string_view prefix) {
  return std::all_of(std::begin(rows), std::end(rows), [&](const auto& row) {
    return make_string_view(row.first).starts_with(prefix);
  });
}

std::filesystem::path make_scratch_path() {
  static auto sequence = std::atomic<uint64_t>{0};
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("verity-replay-" + std::to_string(stamp) + "-" +
          std::to_string(sequence.fetch_add(1)));
}

}  // namespace

namespace verity::execution {

engine::engine(encoder_t& encoder,
               verity::storage::storage<verity::storage::rocksdb_storage_tag>&
                   storage,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      chain_id_{registry_chain_id()},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{verity::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; signatures are not verified");
  } else if (!verity::crypto::available()) {
    spdlog::warn("OpenSSL lacks ed25519/secp256k1; signed txs will fail");
  }
  spdlog::info("Execution engine ready at height {} (initialized: {})",
               last_committed_height_, genesis_.has_value());
}

transaction_result_t engine::init_chain(const genesis_t& genesis) {
  auto lock = std::scoped_lock{mutex_};
  if (genesis_) {
    return make_error_result(
        transaction_error_code::registry_already_initialized,
        "registry already initialized", "genesis was applied earlier",
        kFinalizeCodespace);
  }
  if (genesis.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "genesis chain id does not match",
                             kFinalizeCodespace);
  }

  auto state = verity::registry::state_context{
      encoder_, storage_,
      verity::registry::block_context{.height = 0,
                                      .tx_index = 0,
                                      .time = genesis.genesis_time}};
  auto components = verity::registry::components{state};
  if (auto error = components.roles.initialize(genesis.admin)) {
    state.rollback();
    return make_error_result(error->code, error->log, {}, kFinalizeCodespace);
  }
  state.commit();
  storage_.save_genesis(genesis);
  genesis_ = genesis;

  last_committed_height_ = 0;
  last_committed_state_root_ =
      verity::blake3::hash(bytes_view_t{encoder_.encode(genesis)});
  last_block_time_ = genesis.genesis_time;
  pending_height_ = 0;
  pending_state_root_ = last_committed_state_root_;
  pending_block_time_ = last_block_time_;
  storage_.save_committed_state(
      verity::storage::committed_state{.height = last_committed_height_,
                                       .state_root = last_committed_state_root_,
                                       .block_time = last_block_time_});
  spdlog::info("Genesis applied with admin {}", to_string(genesis.admin));

  auto result = transaction_result_t{};
  result.data = bytes_t{std::begin(last_committed_state_root_),
                        std::end(last_committed_state_root_)};
  result.info = "genesis applied";
  return result;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  if (raw_tx.empty()) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "empty transaction",
                             kCheckTxCodespace);
  }
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "failed to decode",
                             kCheckTxCodespace);
  }
  auto state = verity::registry::state_context{
      encoder_, storage_,
      verity::registry::block_context{
          .height = static_cast<uint64_t>(last_committed_height_ + 1),
          .tx_index = 0,
          .time = last_block_time_}};
  if (auto rejected = validate_transaction(*maybe_tx, kCheckTxCodespace,
                                           state)) {
    spdlog::debug("CheckTx rejected: {}", rejected->log);
    return *rejected;
  }
  return transaction_result_t{};
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto index = static_cast<uint32_t>(i);
    auto state = verity::registry::state_context{
        encoder_, storage_,
        verity::registry::block_context{
            .height = height, .tx_index = index, .time = block_time}};
    auto tx_result = execute_transaction(bytes_view_t{txs[i]}, state);

    auto entry = history_entry_t{.height = height,
                                 .index = index,
                                 .code = tx_result.code,
                                 .block_time = block_time,
                                 .tx = txs[i]};
    auto history_key = key::make_history_key(height, index);
    if (tx_result.code == 0) {
      state.put(history_key, entry);
      state.commit();
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      state.rollback();
      // Replay starts from genesis, so pre-genesis rejections stay out of
      // history.
      if (genesis_) {
        storage_.put(encoder_, bytes_view_t{history_key}, entry);
      }
      spdlog::warn("Tx {} at height {} failed with code {}: {}", i, height,
                   tx_result.code, tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  pending_block_time_ = block_time;
  result.state_root = rolling_root;
  spdlog::debug("Finalized height {} with {} tx(s)", height, txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    last_block_time_ = pending_block_time_;
    pending_height_ = 0;
  }

  storage_.save_committed_state(
      verity::storage::committed_state{.height = last_committed_height_,
                                       .state_root = last_committed_state_root_,
                                       .block_time = last_block_time_});
  spdlog::info("Committed height {}", last_committed_height_);

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  result.initialized = genesis_.has_value();
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;

  auto fail = [&](query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    result.info = std::string{path};
    result.codespace = std::string{kQueryCodespace};
    return result;
  };
  auto answer = [&](const auto& value) {
    result.value = encoder_.encode(value);
    return result;
  };

  auto state = verity::registry::state_context{
      encoder_, storage_,
      verity::registry::block_context{
          .height = static_cast<uint64_t>(last_committed_height_),
          .tx_index = 0,
          .time = last_block_time_}};
  auto components = verity::registry::components{state};

  if (path == "/engine/info") {
    return answer(std::tuple{last_committed_height_, last_committed_state_root_,
                             chain_id_});
  }
  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    for (const auto& prefix : key::kEngineKeyspaces) {
      keyspaces.emplace_back(prefix);
    }
    return answer(keyspaces);
  }
  if (path == "/registry/admin") {
    return answer(components.roles.admin());
  }
  if (path == "/registry/verifier") {
    auto principal = encoder_.try_decode<principal_t>(data);
    if (!principal) {
      return fail(query_error_code::invalid_key, "expected principal");
    }
    return answer(components.roles.is_authorized_verifier(*principal));
  }
  if (path == "/registry/verifiers") {
    return answer(components.roles.verifiers());
  }
  if (path == "/identity") {
    auto principal = encoder_.try_decode<principal_t>(data);
    if (!principal) {
      return fail(query_error_code::invalid_key, "expected principal");
    }
    return answer(components.identities.get_identity(*principal));
  }
  if (path == "/identity/credentials") {
    auto principal = encoder_.try_decode<principal_t>(data);
    if (!principal) {
      return fail(query_error_code::invalid_key, "expected principal");
    }
    return answer(components.credentials.ids_for_subject(*principal));
  }
  if (path == "/credential") {
    auto id = encoder_.try_decode<credential_id_t>(data);
    if (!id) {
      return fail(query_error_code::invalid_key, "expected credential id");
    }
    return answer(components.credentials.get(*id));
  }
  if (path == "/credential/total") {
    return answer(components.credentials.total());
  }
  if (path == "/credential/status") {
    auto id = encoder_.try_decode<credential_id_t>(data);
    if (!id) {
      return fail(query_error_code::invalid_key, "expected credential id");
    }
    return answer(components.credentials.status(*id, last_block_time_));
  }
  if (path == "/history/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected height range");
    }
    return answer(history_locked(std::get<0>(*range), std::get<1>(*range)));
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "expected event id range");
    }
    return answer(
        components.events.range(std::get<0>(*range), std::get<1>(*range)));
  }
  return fail(query_error_code::unsupported_path, "unsupported query path");
}

std::vector<history_entry_t> engine::history(uint64_t from_height,
                                             uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return history_locked(from_height, to_height);
}

std::vector<history_entry_t> engine::history_locked(uint64_t from_height,
                                                    uint64_t to_height) const {
  auto rows = storage_.list_by_prefix(make_bytes_view(key::kHistoryPrefix));
  auto indexed =
      std::vector<std::pair<std::pair<uint64_t, uint32_t>, history_entry_t>>{};
  indexed.reserve(rows.size());
  for (const auto& [row_key, value] : rows) {
    auto position = key::parse_history_key(bytes_view_t{row_key});
    if (!position) {
      spdlog::warn("Skipping malformed history key");
      continue;
    }
    if (position->first < from_height || position->first > to_height) {
      continue;
    }
    indexed.emplace_back(*position,
                         encoder_.decode<history_entry_t>(bytes_view_t{value}));
  }
  // Key bytes hold little-endian integers; restore execution order.
  std::sort(std::begin(indexed), std::end(indexed),
            [](const auto& lhs, const auto& rhs) {
              return lhs.first < rhs.first;
            });

  auto entries = std::vector<history_entry_t>{};
  entries.reserve(indexed.size());
  for (auto& [position, entry] : indexed) {
    entries.push_back(std::move(entry));
  }
  return entries;
}

bool engine::export_backup(std::string_view backup_path) const {
  auto backup = export_backup();
  auto output = std::ofstream{std::string{backup_path},
                              std::ios::binary | std::ios::trunc};
  if (!output) {
    spdlog::error("Failed to open backup path '{}'", backup_path);
    return false;
  }
  output.write(reinterpret_cast<const char*>(backup.data()),
               static_cast<std::streamsize>(backup.size()));
  if (!output) {
    spdlog::error("Failed to write backup to '{}'", backup_path);
    return false;
  }
  spdlog::info("Exported {} byte backup to '{}'", backup.size(), backup_path);
  return true;
}

bytes_t engine::export_backup() const {
  auto lock = std::scoped_lock{mutex_};
  return export_backup_locked();
}

bytes_t engine::export_backup_locked() const {
  auto checkpoint = std::optional<backup_checkpoint_t>{};
  if (auto committed = storage_.load_committed_state()) {
    checkpoint = backup_checkpoint_t{committed->height, committed->state_root,
                                     committed->block_time};
  }
  auto backup =
      backup_t{kBackupFormatVersion,
               checkpoint,
               storage_.list_by_prefix(make_bytes_view(key::kStatePrefix)),
               storage_.list_by_prefix(make_bytes_view(key::kHistoryPrefix)),
               storage_.list_by_prefix(make_bytes_view(key::kEventPrefix)),
               genesis_,
               chain_id_};
  return encoder_.encode(backup);
}

bool engine::load_backup(std::string_view backup_path) {
  auto input = std::ifstream{std::string{backup_path}, std::ios::binary};
  if (!input) {
    spdlog::warn("Failed to open backup path '{}'", backup_path);
    return false;
  }
  auto backup = bytes_t{std::istreambuf_iterator<char>{input},
                        std::istreambuf_iterator<char>{}};
  auto error = std::string{};
  if (!load_backup(bytes_view_t{backup}, error)) {
    spdlog::warn("Rejected backup '{}': {}", backup_path, error);
    return false;
  }
  return true;
}

bool engine::load_backup(const bytes_view_t& backup, std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  auto decoded = encoder_.try_decode<backup_t>(backup);
  if (!decoded) {
    error = "failed to decode backup";
    return false;
  }
  auto& [version, checkpoint, state_rows, history_rows, event_rows, genesis,
         chain_id] = *decoded;
  if (version != kBackupFormatVersion) {
    error = "unsupported backup version " + std::to_string(version);
    return false;
  }
  if (chain_id != chain_id_) {
    error = "backup chain id does not match";
    return false;
  }
  if (!rows_within(state_rows, key::kStatePrefix) ||
      !rows_within(history_rows, key::kHistoryPrefix) ||
      !rows_within(event_rows, key::kEventPrefix)) {
    error = "backup row outside its keyspace";
    return false;
  }

  storage_.replace_by_prefix(make_bytes_view(key::kStatePrefix), state_rows);
  storage_.replace_by_prefix(make_bytes_view(key::kHistoryPrefix),
                             history_rows);
  storage_.replace_by_prefix(make_bytes_view(key::kEventPrefix), event_rows);
  storage_.replace_by_prefix(make_bytes_view(verity::storage::kAppKeyPrefix),
                             {});
  if (genesis) {
    storage_.save_genesis(*genesis);
  }
  if (checkpoint) {
    storage_.save_committed_state(verity::storage::committed_state{
        .height = std::get<0>(*checkpoint),
        .state_root = std::get<1>(*checkpoint),
        .block_time = std::get<2>(*checkpoint)});
  }

  load_persisted_state();
  spdlog::info("Loaded backup at height {} ({} state, {} history, {} event "
               "rows)",
               last_committed_height_, state_rows.size(), history_rows.size(),
               event_rows.size());
  return true;
}

replay_result_t engine::replay_history() {
  auto lock = std::scoped_lock{mutex_};
  auto result = replay_result_t{};
  if (!genesis_) {
    result.error = "registry not initialized";
    return result;
  }

  auto entries =
      history_locked(0, std::numeric_limits<uint64_t>::max());
  result.tx_count = entries.size();

  auto scratch_path = make_scratch_path();
  {
    auto scratch_storage =
        verity::storage::make_storage<verity::storage::rocksdb_storage_tag>(
            scratch_path.string());
    auto scratch = engine{encoder_, scratch_storage, require_strict_crypto_};
    scratch.signature_verifier_ = signature_verifier_;

    auto init = scratch.init_chain(*genesis_);
    if (init.code != 0) {
      result.error = "replay genesis failed: " + init.log;
    }

    auto begin = std::begin(entries);
    while (result.error.empty() && begin != std::end(entries)) {
      auto height = begin->height;
      auto end = std::find_if(begin, std::end(entries), [&](const auto& entry) {
        return entry.height != height;
      });
      auto txs = std::vector<bytes_t>{};
      for (auto it = begin; it != end; ++it) {
        txs.push_back(it->tx);
      }

      auto block = scratch.finalize_block(height, begin->block_time, txs);
      scratch.commit();
      for (size_t i = 0; i < block.tx_results.size(); ++i) {
        const auto& recorded = *(begin + static_cast<std::ptrdiff_t>(i));
        if (block.tx_results[i].code != recorded.code) {
          result.error = "result code mismatch at height " +
                         std::to_string(height) + " index " +
                         std::to_string(recorded.index);
          break;
        }
        if (recorded.code == 0) {
          ++result.applied_count;
        }
      }
      result.last_height = static_cast<int64_t>(height);
      begin = end;
    }
    result.state_root = scratch.info().last_block_state_root;
  }

  auto remove_error = std::error_code{};
  std::filesystem::remove_all(scratch_path, remove_error);
  if (remove_error) {
    spdlog::warn("Failed to remove replay scratch '{}': {}",
                 scratch_path.string(), remove_error.message());
  }

  if (result.error.empty() && result.state_root != last_committed_state_root_) {
    result.error = "state root mismatch";
  }
  result.ok = result.error.empty();
  if (result.ok) {
    spdlog::info("Replayed {} tx(s); state root matches", result.tx_count);
  } else {
    spdlog::warn("Replay failed: {}", result.error);
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!verifier) {
    spdlog::warn("Ignoring empty signature verifier");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

std::optional<transaction_result_t> engine::validate_transaction(
    const transaction_t& tx,
    std::string_view codespace,
    const verity::registry::state_context& state) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id", "chain id does not match",
                             codespace);
  }
  if (!genesis_) {
    return make_error_result(transaction_error_code::registry_not_initialized,
                             "registry not initialized",
                             "init_chain has not run", codespace);
  }

  auto expected_nonce =
      state.get<uint64_t>(key::make_nonce_key(tx.signer)).value_or(0) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error_result(transaction_error_code::invalid_nonce,
                             "invalid nonce",
                             "expected nonce " + std::to_string(expected_nonce),
                             codespace);
  }

  if (!require_strict_crypto_) {
    return std::nullopt;
  }
  if (std::holds_alternative<named_signer_t>(tx.signer)) {
    return make_error_result(
        transaction_error_code::signature_verification_failed,
        "signature verification failed", "named signers cannot be verified",
        codespace);
  }
  if (!signature_matches_signer(tx.signer, tx.signature)) {
    return make_error_result(transaction_error_code::invalid_signature_type,
                             "invalid signature type",
                             "signature does not match signer key type",
                             codespace);
  }
  auto message = make_signing_message(tx);
  if (!signature_verifier_(bytes_view_t{message}, tx.signer, tx.signature)) {
    return make_error_result(
        transaction_error_code::signature_verification_failed,
        "signature verification failed", "signature does not verify",
        codespace);
  }
  return std::nullopt;
}

transaction_result_t engine::execute_transaction(
    const bytes_view_t& raw_tx,
    verity::registry::state_context& state) {
  if (raw_tx.empty()) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "empty transaction",
                             kFinalizeCodespace);
  }
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", "failed to decode",
                             kFinalizeCodespace);
  }
  if (auto rejected =
          validate_transaction(*maybe_tx, kFinalizeCodespace, state)) {
    return *rejected;
  }
  return execute_operation(*maybe_tx, state);
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    verity::registry::state_context& state) {
  auto components = verity::registry::components{state};
  auto status = verity::registry::operation_status_t{};
  auto result = transaction_result_t{};

  std::visit(
      overloaded{
          [&](const create_identity_t& operation) {
            status = components.identities.create_identity(
                tx.signer, operation.name, operation.email);
            result.info = "create_identity";
          },
          [&](const authorize_verifier_t& operation) {
            status = components.roles.authorize_verifier(tx.signer,
                                                         operation.target);
            result.info = "authorize_verifier";
          },
          [&](const issue_credential_t& operation) {
            auto issued = components.credentials.issue(
                tx.signer, operation.subject, operation.credential_type,
                operation.data, operation.expiration_duration);
            if (const auto* id = std::get_if<credential_id_t>(&issued)) {
              result.data = encoder_.encode(*id);
            } else {
              status = std::get<verity::registry::operation_error>(issued);
            }
            result.info = "issue_credential";
          },
          [&](const verify_identity_t& operation) {
            status = components.verification.verify(
                tx.signer, operation.subject, operation.credential_id);
            if (!status) {
              result.data = encoder_.encode(true);
            }
            result.info = "verify_identity";
          },
          [&](const revoke_credential_t& operation) {
            status = components.credentials.revoke(tx.signer,
                                                   operation.credential_id);
            result.info = "revoke_credential";
          }},
      tx.payload);

  if (status) {
    return make_error_result(status->code, status->log, result.info,
                             kFinalizeCodespace);
  }

  state.put(key::make_nonce_key(tx.signer), tx.nonce);
  result.events = state.events();
  spdlog::debug("Executed {} from {} at height {} index {}", result.info,
                to_string(tx.signer), state.block().height,
                state.block().tx_index);
  return result;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  last_committed_height_ = 0;
  last_committed_state_root_ = make_zero_hash();
  last_block_time_ = 0;
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_block_time_ = committed->block_time;
  }
  pending_height_ = 0;
  pending_state_root_ = last_committed_state_root_;
  pending_block_time_ = last_block_time_;
  genesis_ = storage_.load_genesis();
}

}  // namespace verity::execution
