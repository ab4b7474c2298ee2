#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/query_error_code.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: query result.
// Read API envelope. key echoes the request data; height is the last
// committed height the answer was read at.
namespace notary::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

query_result_t make_query_error(query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height,
                                std::string_view codespace);

}  // namespace notary::schema
