#include <verity/schema/encoding/scale/verifier_grant.hpp>

namespace verity::schema {

void encode(const verifier_grant<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.verifier, encoder);
  encode(o.authorized_by, encoder);
  encode(o.authorized_at, encoder);
}

void decode(verifier_grant<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.verifier, decoder);
  decode(o.authorized_by, decoder);
  decode(o.authorized_at, decoder);
}

}  // namespace verity::schema
