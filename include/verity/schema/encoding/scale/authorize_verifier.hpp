#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/authorize_verifier.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const authorize_verifier<1>& o, ::scale::Encoder& encoder);
void decode(authorize_verifier<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
