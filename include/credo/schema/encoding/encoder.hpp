#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <span>

namespace credo::schema::encoding {

// Encoder selection is a build time setting: callers name a library tag
// (e.g. scale_encoder_tag) and get the matching specialization. Hot swapping
// codecs at runtime is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  credo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credo::schema::bytes_t& out);

  template <typename T>
  T decode(const credo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const credo::schema::bytes_view_t& bytes);
};

}  // namespace credo::schema::encoding
