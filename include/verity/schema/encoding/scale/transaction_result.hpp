#pragma once
#include <verity/schema/encoding/scale/transaction_event.hpp>
#include <verity/schema/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const transaction_result<1>& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
