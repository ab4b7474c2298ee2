#pragma once

#include <notary/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace notary::testing {

inline notary::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = notary::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline notary::schema::account_id_t make_account(const uint8_t seed) {
  auto account = notary::schema::account_id_t{};
  account.fill(seed);
  return account;
}

inline notary::schema::proof_t make_proof(const std::string_view text) {
  return notary::schema::make_bytes(text);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace notary::testing
