#include <spdlog/spdlog.h>
#include <verity/registry/state_context.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace verity::registry {

state_context::state_context(encoder_t& encoder,
                             storage_t& storage,
                             block_context block)
    : encoder_{encoder}, storage_{storage}, block_{block} {}

std::vector<verity::storage::key_value_entry_t> state_context::list_by_prefix(
    const verity::schema::bytes_t& prefix) const {
  auto merged = std::map<verity::schema::bytes_t, verity::schema::bytes_t>{};
  for (auto& [key, value] :
       storage_.list_by_prefix(verity::schema::make_bytes_view(prefix))) {
    merged.emplace(std::move(key), std::move(value));
  }
  for (auto it = writes_.lower_bound(prefix); it != std::end(writes_); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    merged[key] = it->second;
  }
  return {std::make_move_iterator(std::begin(merged)),
          std::make_move_iterator(std::end(merged))};
}

const block_context& state_context::block() const {
  return block_;
}

encoder_t& state_context::encoder() const {
  return encoder_;
}

void state_context::emit(verity::schema::transaction_event_t event) {
  events_.push_back(std::move(event));
}

const std::vector<verity::schema::transaction_event_t>& state_context::events()
    const {
  return events_;
}

std::vector<verity::storage::key_value_entry_t> state_context::pending_writes()
    const {
  return {std::begin(writes_), std::end(writes_)};
}

void state_context::commit() {
  spdlog::debug("Committing {} buffered write(s) at height {} index {}",
                writes_.size(), block_.height, block_.tx_index);
  storage_.write_batch(pending_writes());
  writes_.clear();
}

void state_context::rollback() {
  if (!writes_.empty()) {
    spdlog::debug("Discarding {} buffered write(s) at height {} index {}",
                  writes_.size(), block_.height, block_.tx_index);
  }
  writes_.clear();
  events_.clear();
}

}  // namespace verity::registry
