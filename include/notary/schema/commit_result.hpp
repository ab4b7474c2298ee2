#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Checkpoint written by Commit. retain_height stays 0: every block is kept
// because the registry has no pruning.
namespace notary::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t retain_height{};
  int64_t committed_height{};
  hash32_t app_hash{};
};

using commit_result_t = commit_result<1>;

}  // namespace notary::schema
