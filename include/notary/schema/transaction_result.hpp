#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <notary/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction result.
// Outcome of CheckTx, proposal validation or block execution for one
// transaction. code 0 is success; anything else is a transaction_error_code.
namespace notary::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  int64_t gas_wanted{};
  int64_t gas_used{};
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

/// Rejected transaction: log carries the reason, info the offending value.
transaction_result_t make_transaction_error(transaction_error_code code,
                                            std::string log,
                                            std::string info,
                                            std::string_view codespace);

}  // namespace notary::schema
