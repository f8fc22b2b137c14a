#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/genesis.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const genesis<1>& o, ::scale::Encoder& encoder);
void decode(genesis<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
