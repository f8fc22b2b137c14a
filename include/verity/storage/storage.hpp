#pragma once
#include <verity/schema/genesis.hpp>
#include <verity/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace verity::storage {

using key_value_entry_t =
    std::pair<verity::schema::bytes_t, verity::schema::bytes_t>;

inline constexpr std::string_view kAppKeyPrefix{"SYS|APP|"};

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  verity::schema::hash32_t state_root;
  verity::schema::timestamp_seconds_t block_time{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const verity::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const verity::schema::bytes_view_t& key,
           const T& value);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Load the genesis record applied at chain bring-up.
  std::optional<verity::schema::genesis_t> load_genesis() const;

  /// Persist the genesis record.
  void save_genesis(const verity::schema::genesis_t& genesis) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const verity::schema::bytes_view_t& prefix) const;

  /// Atomically write every entry, or none of them.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const verity::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace verity::storage
