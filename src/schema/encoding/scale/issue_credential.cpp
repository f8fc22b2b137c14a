#include <verity/schema/encoding/scale/issue_credential.hpp>

namespace verity::schema {

void encode(const issue_credential<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.credential_type, encoder);
  encode(o.data, encoder);
  encode(o.expiration_duration, encoder);
}

void decode(issue_credential<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.credential_type, decoder);
  decode(o.data, decoder);
  decode(o.expiration_duration, decoder);
}

}  // namespace verity::schema
