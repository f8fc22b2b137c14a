#pragma once

#include <verity/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: credential status.
// Registry workflow: derived usability of a credential at a point in time.
// Never persisted.
namespace verity::schema {

enum class credential_status_t : uint8_t { active = 0, revoked = 1, expired = 2 };

inline constexpr auto kCredentialStatusMappings = std::array{
    std::pair<std::string_view, credential_status_t>{"active",
                                                     credential_status_t::active},
    std::pair<std::string_view, credential_status_t>{
        "revoked", credential_status_t::revoked},
    std::pair<std::string_view, credential_status_t>{
        "expired", credential_status_t::expired},
};

template <>
inline std::optional<credential_status_t> try_from_string<credential_status_t>(
    const std::string_view name) {
  return from_string(name, kCredentialStatusMappings);
}

inline constexpr std::string_view to_string(const credential_status_t value) {
  return name_or_unknown(value, kCredentialStatusMappings);
}

}  // namespace verity::schema
