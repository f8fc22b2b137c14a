#pragma once
#include <verity/schema/revoke_credential.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const revoke_credential<1>& o, ::scale::Encoder& encoder);
void decode(revoke_credential<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
