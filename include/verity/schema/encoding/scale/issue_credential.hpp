#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/issue_credential.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const issue_credential<1>& o, ::scale::Encoder& encoder);
void decode(issue_credential<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
