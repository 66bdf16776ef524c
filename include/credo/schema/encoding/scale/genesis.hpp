#pragma once
#include <credo/schema/genesis.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const genesis<1>& o, ::scale::Encoder& encoder);
void decode(genesis<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
