#include <credo/schema/encoding/scale/identity_record.hpp>

namespace credo::schema {

void encode(const identity_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.email, encoder);
  encode(o.profile_hash, encoder);
  encode(o.reputation_score, encoder);
  encode(o.is_verified, encoder);
  encode(o.created_at, encoder);
  encode(o.last_updated, encoder);
}

void decode(identity_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.email, decoder);
  decode(o.profile_hash, decoder);
  decode(o.reputation_score, decoder);
  decode(o.is_verified, decoder);
  decode(o.created_at, decoder);
  decode(o.last_updated, decoder);
}

}  // namespace credo::schema
