#pragma once

#include <verity/schema/primitives.hpp>
#include <verity/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Registry workflow: per-transaction results plus the candidate post-block
// state root.
namespace verity::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root;
};

using block_result_t = block_result<1>;

}  // namespace verity::schema
