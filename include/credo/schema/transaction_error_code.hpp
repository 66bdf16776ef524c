#pragma once

#include <cstdint>

namespace credo::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_block = 5,
  signature_verification_failed = 6,
  registry_uninitialized = 7,
  invalid_input = 10,
  not_found = 11,
  already_exists = 12,
  forbidden = 13,
  index_out_of_range = 14,
};

}  // namespace credo::schema
