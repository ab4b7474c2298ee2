#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: claim event.
// Emitted once per successful registry transition and published to ABCI event
// consumers. new_owner is only set for transfers.
namespace notary::schema {

enum class claim_event_kind : uint8_t {
  claim_created = 0,
  claim_transfered = 1,
  claim_revoked = 2,
};

std::string_view to_string(claim_event_kind kind);

template <uint16_t Version>
struct claim_event;

template <>
struct claim_event<1> final {
  uint16_t version{1};
  claim_event_kind kind{claim_event_kind::claim_created};
  account_id_t sender{};
  std::optional<account_id_t> new_owner;
  proof_t proof;
};

using claim_event_t = claim_event<1>;

inline bool operator==(const claim_event_t& lhs, const claim_event_t& rhs) {
  return lhs.kind == rhs.kind && lhs.sender == rhs.sender &&
         lhs.new_owner == rhs.new_owner && lhs.proof == rhs.proof;
}

}  // namespace notary::schema
