#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::execution {

struct engine_config final {
  notary::schema::hash32_t chain_id{};
  // Longest accepted proof, in bytes. Must be positive.
  uint32_t max_bytes_in_hash{64};
  // When false, signatures are not checked at all.
  bool require_strict_crypto{true};
};

}  // namespace notary::execution
