#include <credo/schema/encoding/scale/add_credential.hpp>

namespace credo::schema {

void encode(const add_credential<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.subject, encoder);
  encode(o.credential_type, encoder);
  encode(o.credential_hash, encoder);
  encode(o.expires_at, encoder);
}

void decode(add_credential<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.subject, decoder);
  decode(o.credential_type, decoder);
  decode(o.credential_hash, decoder);
  decode(o.expires_at, decoder);
}

}  // namespace credo::schema
