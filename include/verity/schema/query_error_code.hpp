#pragma once

#include <cstdint>

// Schema type: query error code.
// Registry workflow: read-path failure taxonomy. Missing records are not
// errors; they are returned as empty optionals.
namespace verity::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 3,
};

}  // namespace verity::schema
