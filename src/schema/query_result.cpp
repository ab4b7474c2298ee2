#include <notary/schema/query_result.hpp>

#include <utility>

namespace notary::schema {

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height,
                                const std::string_view codespace) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace notary::schema
