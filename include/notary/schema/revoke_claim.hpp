#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct revoke_claim;

template <>
struct revoke_claim<1> final {
  uint16_t version{1};
  proof_t proof;
};

using revoke_claim_t = revoke_claim<1>;

}  // namespace notary::schema
