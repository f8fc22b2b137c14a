#pragma once
#include <verity/schema/block_result.hpp>
#include <verity/schema/encoding/scale/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const block_result<1>& o, ::scale::Encoder& encoder);
void decode(block_result<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
