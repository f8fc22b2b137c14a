#pragma once
#include <verity/schema/history_entry.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const history_entry<1>& o, ::scale::Encoder& encoder);
void decode(history_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
