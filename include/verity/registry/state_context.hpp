#pragma once

#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/schema/primitives.hpp>
#include <verity/schema/transaction_event.hpp>
#include <verity/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace verity::registry {

using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;
using storage_t =
    verity::storage::storage<verity::storage::rocksdb_storage_tag>;

/// Position and time of the transaction being executed, as supplied by the
/// ledger.
struct block_context final {
  uint64_t height{};
  uint32_t tx_index{};
  verity::schema::timestamp_seconds_t time{};
};

/// Write overlay for one transaction.
///
/// Reads see the overlay first and committed storage second. Nothing reaches
/// storage until `commit()`, which lands every buffered write in one RocksDB
/// write batch. `rollback()` drops buffered writes and emitted events.
class state_context final {
 public:
  state_context(encoder_t& encoder, storage_t& storage, block_context block);

  template <typename T>
  std::optional<T> get(const verity::schema::bytes_t& key) const;

  template <typename T>
  void put(const verity::schema::bytes_t& key, const T& value);

  /// Committed rows under prefix merged with buffered writes, in key order.
  std::vector<verity::storage::key_value_entry_t> list_by_prefix(
      const verity::schema::bytes_t& prefix) const;

  const block_context& block() const;
  encoder_t& encoder() const;

  void emit(verity::schema::transaction_event_t event);
  const std::vector<verity::schema::transaction_event_t>& events() const;

  /// Buffered writes in key order.
  std::vector<verity::storage::key_value_entry_t> pending_writes() const;

  void commit();
  void rollback();

 private:
  encoder_t& encoder_;
  storage_t& storage_;
  block_context block_;
  std::map<verity::schema::bytes_t, verity::schema::bytes_t> writes_;
  std::vector<verity::schema::transaction_event_t> events_;
};

template <typename T>
std::optional<T> state_context::get(const verity::schema::bytes_t& key) const {
  if (auto it = writes_.find(key); it != std::end(writes_)) {
    return encoder_.decode<T>(verity::schema::make_bytes_view(it->second));
  }
  return storage_.get<T>(encoder_, verity::schema::make_bytes_view(key));
}

template <typename T>
void state_context::put(const verity::schema::bytes_t& key, const T& value) {
  writes_[key] = encoder_.encode(value);
}

}  // namespace verity::registry
