#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct transfer_claim;

template <>
struct transfer_claim<1> final {
  uint16_t version{1};
  account_id_t new_owner{};
  proof_t proof;
};

using transfer_claim_t = transfer_claim<1>;

}  // namespace notary::schema
