#pragma once
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace credo::blake3 {

credo::schema::hash32_t hash(const std::string_view& str);
credo::schema::hash32_t hash(const credo::schema::bytes_view_t& bytes);

}  // namespace credo::blake3
