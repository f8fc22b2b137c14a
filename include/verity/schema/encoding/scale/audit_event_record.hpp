#pragma once
#include <verity/schema/encoding/scale/primitives.hpp>
#include <verity/schema/audit_event_record.hpp>
#include <verity/schema/audit_event_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace verity::schema {

void encode(const audit_event_type_t& o, ::scale::Encoder& encoder);
void decode(audit_event_type_t& o, ::scale::Decoder& decoder);
void encode(const audit_event_record<1>& o, ::scale::Encoder& encoder);
void decode(audit_event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace verity::schema
