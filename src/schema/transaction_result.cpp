#include <notary/schema/transaction_result.hpp>

#include <utility>

namespace notary::schema {

transaction_result_t make_transaction_error(const transaction_error_code code,
                                            std::string log,
                                            std::string info,
                                            const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace notary::schema
