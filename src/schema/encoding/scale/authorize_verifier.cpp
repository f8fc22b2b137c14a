#include <verity/schema/encoding/scale/authorize_verifier.hpp>

namespace verity::schema {

void encode(const authorize_verifier<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.target, encoder);
}

void decode(authorize_verifier<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.target, decoder);
}

}  // namespace verity::schema
