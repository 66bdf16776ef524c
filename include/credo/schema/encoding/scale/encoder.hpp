#pragma once
#include <credo/common/critical.hpp>
#include <credo/schema/encoding/encoder.hpp>
#include <credo/schema/encoding/scale/add_credential.hpp>
#include <credo/schema/encoding/scale/add_trusted_issuer.hpp>
#include <credo/schema/encoding/scale/create_identity.hpp>
#include <credo/schema/encoding/scale/credential_record.hpp>
#include <credo/schema/encoding/scale/event_record.hpp>
#include <credo/schema/encoding/scale/genesis.hpp>
#include <credo/schema/encoding/scale/history_entry.hpp>
#include <credo/schema/encoding/scale/identity_record.hpp>
#include <credo/schema/encoding/scale/registry_stats.hpp>
#include <credo/schema/encoding/scale/remove_trusted_issuer.hpp>
#include <credo/schema/encoding/scale/revoke_credential.hpp>
#include <credo/schema/encoding/scale/transaction.hpp>
#include <credo/schema/encoding/scale/transaction_event.hpp>
#include <credo/schema/encoding/scale/update_profile.hpp>
#include <credo/schema/encoding/scale/verify_identity.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace credo::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  credo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credo::schema::bytes_t& out);

  template <typename T>
  T decode(const credo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const credo::schema::bytes_view_t& bytes);
};

template <typename T>
credo::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    credo::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        credo::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const credo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    credo::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const credo::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace credo::schema::encoding
