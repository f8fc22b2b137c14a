#pragma once
#include <verity/schema/primitives.hpp>

// Schema type: authorize verifier.
// Registry workflow: admin-only grant of the verifier role.
namespace verity::schema {

template <uint16_t Version>
struct authorize_verifier;

template <>
struct authorize_verifier<1> final {
  uint16_t version{1};
  principal_t target;
};

using authorize_verifier_t = authorize_verifier<1>;

}  // namespace verity::schema
