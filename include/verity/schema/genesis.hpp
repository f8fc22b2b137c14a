#pragma once
#include <verity/schema/primitives.hpp>

// Schema type: genesis.
// Registry workflow: one-time bring-up parameters. The admin becomes the
// permanent registry administrator and its first authorized verifier.
namespace verity::schema {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  principal_t admin;
  timestamp_seconds_t genesis_time{};
};

using genesis_t = genesis<1>;

}  // namespace verity::schema
