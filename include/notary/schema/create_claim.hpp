#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct create_claim;

template <>
struct create_claim<1> final {
  uint16_t version{1};
  proof_t proof;
};

using create_claim_t = create_claim<1>;

}  // namespace notary::schema
