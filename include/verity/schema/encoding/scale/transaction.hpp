#pragma once
#include <verity/schema/encoding/scale/authorize_verifier.hpp>
#include <verity/schema/encoding/scale/create_identity.hpp>
#include <verity/schema/encoding/scale/issue_credential.hpp>
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/encoding/scale/revoke_credential.hpp>
#include <verity/schema/encoding/scale/verify_identity.hpp>
#include <verity/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
