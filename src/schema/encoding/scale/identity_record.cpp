#include <verity/schema/encoding/scale/identity_record.hpp>

namespace verity::schema {

void encode(const identity_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
  encode(o.created_at, encoder);
  encode(o.is_verified, encoder);
  encode(o.attributes, encoder);
  encode(o.verifiers, encoder);
}

void decode(identity_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
  decode(o.created_at, decoder);
  decode(o.is_verified, decoder);
  decode(o.attributes, decoder);
  decode(o.verifiers, decoder);
}

}  // namespace verity::schema
