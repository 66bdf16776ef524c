#pragma once
#include <credo/schema/registry_stats.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const registry_stats<1>& o, ::scale::Encoder& encoder);
void decode(registry_stats<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
