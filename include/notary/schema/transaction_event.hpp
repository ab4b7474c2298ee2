#pragma once

#include <notary/schema/claim_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// ABCI projection of a claim event: type is the claim event kind name and
// every attribute is indexed so proofs and accounts are searchable.
namespace notary::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

/// Attributes, in order: sender, new_owner (transfers only), proof. Values
/// are lowercase hex.
transaction_event_t make_transaction_event(const claim_event_t& event);

}  // namespace notary::schema
