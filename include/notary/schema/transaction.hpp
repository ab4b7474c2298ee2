#pragma once
#include <notary/schema/create_claim.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/revoke_claim.hpp>
#include <notary/schema/transfer_claim.hpp>
#include <variant>

namespace notary::schema {

using transaction_payload_t =
    std::variant<create_claim_t, transfer_claim_t, revoke_claim_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  account_id_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace notary::schema
