#include <spdlog/spdlog.h>
#include <verity/registry/event_log.hpp>
#include <verity/schema/key/engine_keys.hpp>

#include <algorithm>
#include <utility>

using namespace verity::schema;

namespace verity::registry {

namespace {

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             bool index) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_transaction_event(const audit_event_record_t& record) {
  auto event = transaction_event_t{};
  event.type = std::string{to_string(record.type)};
  event.attributes.push_back(
      make_attribute("event_id", std::to_string(record.event_id), false));
  event.attributes.push_back(
      make_attribute("actor", to_string(record.actor), true));
  if (record.subject) {
    event.attributes.push_back(
        make_attribute("subject", to_string(*record.subject), true));
  }
  if (record.credential_id) {
    event.attributes.push_back(make_attribute(
        "credential_id", std::to_string(*record.credential_id), true));
  }
  if (!record.detail.empty()) {
    event.attributes.push_back(make_attribute("detail", record.detail, false));
  }
  event.attributes.push_back(make_attribute(
      "timestamp", std::to_string(record.recorded_at), false));
  return event;
}

}  // namespace

event_log::event_log(state_context& state) : state_{state} {}

uint64_t event_log::append(audit_event_type_t type,
                           const principal_t& actor,
                           const std::optional<principal_t>& subject,
                           const std::optional<credential_id_t>& credential_id,
                           std::string detail) {
  const auto& block = state_.block();
  auto event_id = count() + 1;

  auto record = audit_event_record_t{};
  record.event_id = event_id;
  record.height = block.height;
  record.tx_index = block.tx_index;
  record.type = type;
  record.actor = actor;
  record.subject = subject;
  record.credential_id = credential_id;
  record.detail = std::move(detail);
  record.recorded_at = block.time;

  state_.put(key::make_event_key(event_id), record);
  state_.put(key::make_event_sequence_key(), event_id);
  state_.emit(make_transaction_event(record));
  spdlog::debug("Audit event {} '{}' by {}", event_id, to_string(type),
                to_string(actor));
  return event_id;
}

std::optional<audit_event_record_t> event_log::get(uint64_t event_id) const {
  return state_.get<audit_event_record_t>(key::make_event_key(event_id));
}

std::vector<audit_event_record_t> event_log::range(uint64_t from_id,
                                                   uint64_t to_id) const {
  auto records = std::vector<audit_event_record_t>{};
  auto last = std::min(to_id, count());
  for (auto id = std::max<uint64_t>(from_id, 1); id <= last; ++id) {
    if (auto record = get(id)) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

uint64_t event_log::count() const {
  return state_.get<uint64_t>(key::make_event_sequence_key()).value_or(0);
}

}  // namespace verity::registry
