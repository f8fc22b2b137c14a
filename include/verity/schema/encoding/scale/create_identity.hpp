#pragma once
#include <verity/schema/create_identity.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const create_identity<1>& o, ::scale::Encoder& encoder);
void decode(create_identity<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
