#pragma once
#include <credo/schema/add_credential.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const add_credential<1>& o, ::scale::Encoder& encoder);
void decode(add_credential<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
