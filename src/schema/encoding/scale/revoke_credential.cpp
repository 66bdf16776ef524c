#include <credo/schema/encoding/scale/revoke_credential.hpp>

namespace credo::schema {

void encode(const revoke_credential<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.index, encoder);
}

void decode(revoke_credential<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.index, decoder);
}

}  // namespace credo::schema
