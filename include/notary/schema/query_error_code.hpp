#pragma once

#include <cstdint>

// Query failures. Kept apart from transaction_error_code so read-path codes
// never collide with admission codes in client tooling.
namespace notary::schema {

enum class query_error_code : uint32_t {
  // Request data has the wrong shape for the route (proof length, signer
  // size).
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace notary::schema
