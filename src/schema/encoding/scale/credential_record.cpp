#include <credo/schema/encoding/scale/credential_record.hpp>

namespace credo::schema {

void encode(const credential_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.credential_type, encoder);
  encode(o.issuer, encoder);
  encode(o.credential_hash, encoder);
  encode(o.issuer_principal, encoder);
  encode(o.issued_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.is_valid, encoder);
}

void decode(credential_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.credential_type, decoder);
  decode(o.issuer, decoder);
  decode(o.credential_hash, decoder);
  decode(o.issuer_principal, decoder);
  decode(o.issued_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.is_valid, decoder);
}

}  // namespace credo::schema
