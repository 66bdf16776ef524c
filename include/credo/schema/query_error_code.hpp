#pragma once

#include <cstdint>

// Schema type: query error code.
// Registry workflow: stable numeric codes for read-path diagnostics.
namespace credo::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  index_out_of_range = 4,
};

}  // namespace credo::schema
