#include <verity/schema/encoding/scale/block_result.hpp>

namespace verity::schema {

void encode(const block_result<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.tx_results, encoder);
  encode(o.state_root, encoder);
}

void decode(block_result<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.tx_results, decoder);
  decode(o.state_root, decoder);
}

}  // namespace verity::schema
