#include <credo/schema/encoding/scale/add_credential.hpp>
#include <credo/schema/encoding/scale/add_trusted_issuer.hpp>
#include <credo/schema/encoding/scale/create_identity.hpp>
#include <credo/schema/encoding/scale/remove_trusted_issuer.hpp>
#include <credo/schema/encoding/scale/revoke_credential.hpp>
#include <credo/schema/encoding/scale/transaction.hpp>
#include <credo/schema/encoding/scale/update_profile.hpp>
#include <credo/schema/encoding/scale/verify_identity.hpp>

namespace credo::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace credo::schema
