#include <verity/schema/encoding/scale/audit_event_record.hpp>

#include <system_error>

namespace verity::schema {

void encode(const audit_event_type_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(audit_event_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(audit_event_type_t::verifier_authorized)) {
    throw std::system_error{std::make_error_code(std::errc::invalid_argument),
                            "audit_event_type_t out of range"};
  }
  o = static_cast<audit_event_type_t>(raw);
}

void encode(const audit_event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.type, encoder);
  encode(o.actor, encoder);
  encode(o.subject, encoder);
  encode(o.credential_id, encoder);
  encode(o.detail, encoder);
  encode(o.recorded_at, encoder);
}

void decode(audit_event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.type, decoder);
  decode(o.actor, decoder);
  decode(o.subject, decoder);
  decode(o.credential_id, decoder);
  decode(o.detail, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace verity::schema
