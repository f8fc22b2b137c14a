#pragma once

#include <verity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// Registry workflow: one kind per mutating registry operation.
namespace verity::schema {

enum class audit_event_type_t : uint8_t {
  identity_created = 0,
  identity_verified = 1,
  credential_issued = 2,
  credential_revoked = 3,
  verifier_authorized = 4
};

inline constexpr auto kAuditEventTypeMappings = std::array{
    std::pair<std::string_view, audit_event_type_t>{
        "identity_created", audit_event_type_t::identity_created},
    std::pair<std::string_view, audit_event_type_t>{
        "identity_verified", audit_event_type_t::identity_verified},
    std::pair<std::string_view, audit_event_type_t>{
        "credential_issued", audit_event_type_t::credential_issued},
    std::pair<std::string_view, audit_event_type_t>{
        "credential_revoked", audit_event_type_t::credential_revoked},
    std::pair<std::string_view, audit_event_type_t>{
        "verifier_authorized", audit_event_type_t::verifier_authorized},
};

template <>
inline std::optional<audit_event_type_t> try_from_string<audit_event_type_t>(
    const std::string_view name) {
  return from_string(name, kAuditEventTypeMappings);
}

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return name_or_unknown(value, kAuditEventTypeMappings);
}

}  // namespace verity::schema
