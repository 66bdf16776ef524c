#include <credo/schema/encoding/scale/registry_stats.hpp>

namespace credo::schema {

void encode(const registry_stats<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.total_identities, encoder);
}

void decode(registry_stats<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.total_identities, decoder);
}

}  // namespace credo::schema
