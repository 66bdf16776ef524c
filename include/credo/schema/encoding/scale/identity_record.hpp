#pragma once
#include <credo/schema/identity_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const identity_record<1>& o, ::scale::Encoder& encoder);
void decode(identity_record<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
