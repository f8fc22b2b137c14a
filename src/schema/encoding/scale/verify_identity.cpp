#include <verity/schema/encoding/scale/verify_identity.hpp>

namespace verity::schema {

void encode(const verify_identity<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.credential_id, encoder);
}

void decode(verify_identity<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.credential_id, decoder);
}

}  // namespace verity::schema
