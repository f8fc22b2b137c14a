#pragma once
#include <verity/schema/primitives.hpp>

#include <string>
#include <utility>
#include <vector>

// Schema type: identity record.
// Registry workflow: self-declared identity of one principal; name and email
// are write-once, verification only ever escalates.
namespace verity::schema {

template <uint16_t Version>
struct identity_record;

template <>
struct identity_record<1> final {
  uint16_t version{1};
  principal_t owner;
  std::string name;
  std::string email;
  timestamp_seconds_t created_at{};
  bool is_verified{};
  // Reserved extension point; no operation populates it yet. Sorted by key.
  std::vector<std::pair<std::string, std::string>> attributes;
  // Principals that performed a general verification. Sorted, unique.
  std::vector<principal_t> verifiers;
};

using identity_record_t = identity_record<1>;

}  // namespace verity::schema
