#pragma once
#include <verity/schema/replay_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const replay_result<1>& o, ::scale::Encoder& encoder);
void decode(replay_result<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
