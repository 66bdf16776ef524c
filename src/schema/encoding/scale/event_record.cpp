#include <credo/schema/encoding/scale/event_record.hpp>

#include <cstdint>

namespace credo::schema {

void encode(const event_type_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(event_type_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(event_type_t::reputation_updated)) {
    ::scale::raise(::scale::DecodeError::UNEXPECTED_VALUE);
  }
  o = static_cast<event_type_t>(raw);
}

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.type, encoder);
  encode(o.principal, encoder);
  encode(o.attributes, encoder);
  encode(o.recorded_at, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.type, decoder);
  decode(o.principal, decoder);
  decode(o.attributes, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace credo::schema
