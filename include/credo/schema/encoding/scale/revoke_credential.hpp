#pragma once
#include <credo/schema/revoke_credential.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace credo::schema {

void encode(const revoke_credential<1>& o, ::scale::Encoder& encoder);
void decode(revoke_credential<1>& o, ::scale::Decoder& decoder);

}  // namespace credo::schema
