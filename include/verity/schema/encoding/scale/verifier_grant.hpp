#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/verifier_grant.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const verifier_grant<1>& o, ::scale::Encoder& encoder);
void decode(verifier_grant<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
