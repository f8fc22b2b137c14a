#pragma once

#include <verity/registry/state_context.hpp>
#include <verity/schema/audit_event_record.hpp>
#include <optional>
#include <string>
#include <vector>

namespace verity::registry {

/// Append-only audit trail.
///
/// Each append persists an audit_event_record under the next event id and
/// emits the matching transaction_event on the current transaction, so both
/// land or vanish with the transaction.
class event_log final {
 public:
  explicit event_log(state_context& state);

  uint64_t append(verity::schema::audit_event_type_t type,
                  const verity::schema::principal_t& actor,
                  const std::optional<verity::schema::principal_t>& subject,
                  const std::optional<verity::schema::credential_id_t>&
                      credential_id,
                  std::string detail);

  std::optional<verity::schema::audit_event_record_t> get(
      uint64_t event_id) const;

  /// Records with ids in [from_id, to_id], ascending.
  std::vector<verity::schema::audit_event_record_t> range(uint64_t from_id,
                                                          uint64_t to_id) const;

  /// Number of events appended so far.
  uint64_t count() const;

 private:
  state_context& state_;
};

}  // namespace verity::registry
