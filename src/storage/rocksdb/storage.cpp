#include <verity/common/critical.hpp>
#include <verity/storage/rocksdb/storage.hpp>

namespace verity::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    verity::common::critical("Failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    verity::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, verity::schema::hash32_t,
                                    verity::schema::timestamp_seconds_t>>(
          verity::schema::make_bytes_view(committed_raw));
  if (!decoded.has_value()) {
    verity::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  state.block_time = std::get<2>(decoded.value());
  return state;
}

void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.height, state.state_root, state.block_time});
  auto state_status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                    std::string{detail::kCommittedHeightKey},
                    detail::to_slice(encoded));
  if (!state_status.ok()) {
    verity::common::critical("failed to persist committed height");
  }
}

std::optional<verity::schema::genesis_t>
storage<rocksdb_storage_tag>::load_genesis() const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kGenesisKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    verity::common::critical("failed to load genesis");
  }
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<verity::schema::genesis_t>(
      verity::schema::make_bytes_view(raw));
  if (!decoded.has_value()) {
    verity::common::critical("failed to decode genesis");
  }
  return decoded;
}

void storage<rocksdb_storage_tag>::save_genesis(
    const verity::schema::genesis_t& genesis) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(genesis);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              std::string{detail::kGenesisKey},
                              detail::to_slice(encoded));
  if (!status.ok()) {
    verity::common::critical("failed to persist genesis");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const verity::schema::bytes_view_t& prefix) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    verity::common::critical("failed to scan prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      verity::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    verity::common::critical("failed to commit write batch");
  }
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const verity::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    verity::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      verity::common::critical("failed deleting key during prefix replacement");
    }
    iterator->Next();
  }

  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      verity::common::critical("failed writing key during prefix replacement");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    verity::common::critical("failed to commit prefix replacement");
  }
}

}  // namespace verity::storage
