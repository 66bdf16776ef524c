#include <credo/schema/encoding/scale/create_identity.hpp>

namespace credo::schema {

void encode(const create_identity<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
  encode(o.profile_hash, encoder);
}

void decode(create_identity<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
  decode(o.profile_hash, decoder);
}

}  // namespace credo::schema
