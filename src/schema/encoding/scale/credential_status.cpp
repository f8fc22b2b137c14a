#include <verity/schema/encoding/scale/credential_status.hpp>

#include <system_error>

namespace verity::schema {

void encode(const credential_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(credential_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(credential_status_t::expired)) {
    throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                            "credential_status_t out of range"};
  }
  o = static_cast<credential_status_t>(raw);
}

}  // namespace verity::schema
