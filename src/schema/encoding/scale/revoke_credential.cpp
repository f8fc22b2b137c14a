#include <verity/schema/encoding/scale/revoke_credential.hpp>

namespace verity::schema {

void encode(const revoke_credential<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.credential_id, encoder);
}

void decode(revoke_credential<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.credential_id, decoder);
}

}  // namespace verity::schema
