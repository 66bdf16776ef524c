#pragma once
#include <credo/schema/update_profile.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const update_profile<1>& o, ::scale::Encoder& encoder);
void decode(update_profile<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
