#include <notary/schema/transaction_event.hpp>

#include <string>
#include <utility>

namespace notary::schema {

namespace {

transaction_event_attribute_t indexed(std::string key, std::string value) {
  auto attribute = transaction_event_attribute_t{};
  attribute.key = std::move(key);
  attribute.value = std::move(value);
  attribute.index = true;
  return attribute;
}

}  // namespace

transaction_event_t make_transaction_event(const claim_event_t& event) {
  auto result = transaction_event_t{};
  result.type = std::string{to_string(event.kind)};
  result.attributes.push_back(indexed("sender", to_hex(event.sender)));
  if (event.new_owner) {
    result.attributes.push_back(indexed("new_owner", to_hex(*event.new_owner)));
  }
  result.attributes.push_back(indexed("proof", to_hex(event.proof)));
  return result;
}

}  // namespace notary::schema
