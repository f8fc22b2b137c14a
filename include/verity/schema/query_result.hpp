#pragma once

#include <verity/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Registry workflow: read API envelope carrying the SCALE-encoded answer, the
// key echo, and the committed height it was served from.
namespace verity::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace verity::schema
