#pragma once
#include <verity/schema/primitives.hpp>

#include <string>

// Schema type: create identity.
// Registry workflow: self-registration of the signing principal.
namespace verity::schema {

template <uint16_t Version>
struct create_identity;

template <>
struct create_identity<1> final {
  uint16_t version{1};
  std::string name;
  std::string email;
};

using create_identity_t = create_identity<1>;

}  // namespace verity::schema
