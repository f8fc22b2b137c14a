#pragma once

#include <verity/registry/event_log.hpp>
#include <verity/registry/operation_error.hpp>
#include <verity/registry/state_context.hpp>
#include <verity/schema/identity_record.hpp>
#include <optional>
#include <string>

namespace verity::registry {

/// At most one identity per principal. Name and email are write-once; the
/// verification flag only ever moves from false to true.
class identity_store final {
 public:
  identity_store(state_context& state, event_log& events);

  operation_status_t create_identity(const verity::schema::principal_t& caller,
                                     const std::string& name,
                                     const std::string& email);

  /// std::nullopt when the principal never registered.
  std::optional<verity::schema::identity_record_t> get_identity(
      const verity::schema::principal_t& principal) const;

  bool exists(const verity::schema::principal_t& principal) const;

  /// Mark the identity verified and record `verifier` in its verifier set.
  /// Callers check authorization and existence first.
  void record_verification(const verity::schema::principal_t& subject,
                           const verity::schema::principal_t& verifier);

 private:
  state_context& state_;
  event_log& events_;
};

}  // namespace verity::registry
