#include <credo/schema/encoding/scale/add_trusted_issuer.hpp>

namespace credo::schema {

void encode(const add_trusted_issuer<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.issuer, encoder);
}

void decode(add_trusted_issuer<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.issuer, decoder);
}

}  // namespace credo::schema
