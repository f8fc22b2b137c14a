#include <verity/schema/encoding/scale/create_identity.hpp>

namespace verity::schema {

void encode(const create_identity<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
}

void decode(create_identity<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
}

}  // namespace verity::schema
