#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// FinalizeBlock output. tx_results lines up with the request's tx list,
// rejected entries included; app_hash only folds the accepted ones.
namespace notary::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  block_height_t height{};
  std::vector<transaction_result_t> tx_results;
  hash32_t app_hash{};
};

using block_result_t = block_result<1>;

}  // namespace notary::schema
