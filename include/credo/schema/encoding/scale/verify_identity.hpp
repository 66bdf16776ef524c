#pragma once
#include <credo/schema/verify_identity.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const verify_identity<1>& o, ::scale::Encoder& encoder);
void decode(verify_identity<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
