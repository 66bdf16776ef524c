#include <credo/execution/signature_verifier.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace credo::execution {

credo::schema::bytes_t make_signing_message(
    const credo::schema::transaction_t& tx) {
  auto encoder = credo::schema::encoding::encoder<
      credo::schema::encoding::scale_encoder_tag>{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace credo::execution
