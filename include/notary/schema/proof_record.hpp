#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: proof record.
// Registry value: the account currently owning a proof and the block height at
// which the proof was first claimed. created_at never changes after insert.
namespace notary::schema {

template <uint16_t Version>
struct proof_record;

template <>
struct proof_record<1> final {
  uint16_t version{1};
  account_id_t owner{};
  block_height_t created_at{};
};

using proof_record_t = proof_record<1>;

}  // namespace notary::schema
