#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/identity_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const identity_record<1>& o, ::scale::Encoder& encoder);
void decode(identity_record<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
