#include <credo/schema/encoding/scale/genesis.hpp>

namespace credo::schema {

void encode(const genesis<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.owner, encoder);
  encode(o.genesis_time, encoder);
}

void decode(genesis<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.owner, decoder);
  decode(o.genesis_time, decoder);
}

}  // namespace credo::schema
