#pragma once
#include <credo/schema/encoding/scale/transaction_event.hpp>
#include <credo/schema/event_record.hpp>
#include <credo/schema/event_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const event_type_t& o, ::scale::Encoder& encoder);
void decode(event_type_t& o, ::scale::Decoder& decoder);

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
