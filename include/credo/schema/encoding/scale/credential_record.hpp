#pragma once
#include <credo/schema/credential_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const credential_record<1>& o, ::scale::Encoder& encoder);
void decode(credential_record<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
