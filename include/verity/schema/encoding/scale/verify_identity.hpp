#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/verify_identity.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const verify_identity<1>& o, ::scale::Encoder& encoder);
void decode(verify_identity<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
