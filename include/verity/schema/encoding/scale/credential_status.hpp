#pragma once
#include <verity/schema/credential_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const credential_status_t& o, ::scale::Encoder& encoder);
void decode(credential_status_t& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
