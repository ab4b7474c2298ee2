#pragma once

#include <cstdint>

namespace notary::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  proof_too_long = 6,
  proof_already_claimed = 10,
  no_such_proof = 11,
  not_proof_owner = 12,
};

}  // namespace notary::schema
