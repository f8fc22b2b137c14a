#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <verity/common/critical.hpp>
#include <verity/schema/encoding/scale/encoder.hpp>
#include <verity/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace verity::storage {

namespace detail {

using encoder_t = verity::schema::encoding::encoder<
    verity::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};
inline constexpr auto kGenesisKey = std::string_view{"SYS|APP|GENESIS"};

inline verity::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const verity::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const verity::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const verity::schema::bytes_view_t& key,
           const T& value);

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::optional<verity::schema::genesis_t> load_genesis() const;
  void save_genesis(const verity::schema::genesis_t& genesis) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const verity::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
  void replace_by_prefix(const verity::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const verity::schema::bytes_view_t& key) {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      verity::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(verity::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const verity::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                    detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    verity::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace verity::storage
