#pragma once
#include <credo/schema/add_trusted_issuer.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const add_trusted_issuer<1>& o, ::scale::Encoder& encoder);
void decode(add_trusted_issuer<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
