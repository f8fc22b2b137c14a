#pragma once
#include <verity/schema/audit_event_type.hpp>
#include <verity/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: audit event record.
// Registry workflow: append-only trail of registry state transitions, keyed by
// a monotonic event id starting at 1.
namespace verity::schema {

template <uint16_t Version>
struct audit_event_record;

template <>
struct audit_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  audit_event_type_t type{audit_event_type_t::identity_created};
  principal_t actor;
  std::optional<principal_t> subject;
  std::optional<credential_id_t> credential_id;
  std::string detail;
  timestamp_seconds_t recorded_at{};
};

using audit_event_record_t = audit_event_record<1>;

}  // namespace verity::schema
