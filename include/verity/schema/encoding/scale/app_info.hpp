#pragma once
#include <verity/schema/app_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const app_info<1>& o, ::scale::Encoder& encoder);
void decode(app_info<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
