#include <verity/schema/encoding/scale/credential_record.hpp>

namespace verity::schema {

void encode(const credential_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.issuer, encoder);
  encode(o.subject, encoder);
  encode(o.credential_type, encoder);
  encode(o.data, encoder);
  encode(o.issued_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.is_valid, encoder);
}

void decode(credential_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.issuer, decoder);
  decode(o.subject, decoder);
  decode(o.credential_type, decoder);
  decode(o.data, decoder);
  decode(o.issued_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.is_valid, decoder);
}

}  // namespace verity::schema
