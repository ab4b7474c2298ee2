#pragma once

#include <notary/schema/transaction_error_code.hpp>
#include <cstdint>
#include <string_view>

namespace notary::registry {

/// Caller-facing rejection of a claim operation. Every rejection is detected
/// before any mutation, so a failed call leaves the registry untouched and
/// emits nothing.
enum class claim_error : uint8_t {
  proof_already_claimed,
  no_such_proof,
  not_proof_owner,
};

std::string_view to_string(claim_error error);

notary::schema::transaction_error_code to_transaction_error_code(
    claim_error error);

}  // namespace notary::registry
