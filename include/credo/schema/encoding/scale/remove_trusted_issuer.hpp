#pragma once
#include <credo/schema/remove_trusted_issuer.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const remove_trusted_issuer<1>& o, ::scale::Encoder& encoder);
void decode(remove_trusted_issuer<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
