#include <gtest/gtest.h>
#include <notary/blake3/hash.hpp>
#include <notary/execution/signing.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/testing/common.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef NOTARY_TRANSACTION_BUILDER_PATH
#define NOTARY_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

constexpr auto kSigner =
    "1111111111111111111111111111111111111111111111111111111111111111";
constexpr auto kNewOwner =
    "2222222222222222222222222222222222222222222222222222222222222222";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command,
                        const std::string_view args) {
  auto line = shell_quote(builder) + " " + std::string{command} + " " +
              std::string{args} + " 2>/dev/null";
  auto [exit_code, output] = run_capture(line);
  EXPECT_EQ(exit_code, 0) << "command failed: " << line << '\n' << output;
  return trim_ascii_whitespace(output);
}

std::string builder_path() {
  return std::string{NOTARY_TRANSACTION_BUILDER_PATH};
}

bool builder_missing(const std::string& builder) {
  return builder.empty() || !std::filesystem::exists(builder);
}

notary::schema::transaction_t decode_hex_transaction(const std::string& hex) {
  auto bytes = notary::schema::from_hex(hex);
  auto encoder = encoder_t{};
  return encoder.decode<notary::schema::transaction_t>(
      notary::schema::make_bytes_view(bytes));
}

}  // namespace

TEST(transaction_builder, chain_id_is_blake3_of_chain_name) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto output =
      run_command(builder, "chain-id", "--chain-name notary-test-chain");
  EXPECT_EQ(output, notary::schema::to_hex(notary::blake3::hash(
                        std::string_view{"notary-test-chain"})));
}

TEST(transaction_builder, create_claim_transaction_decodes) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto output = run_command(
      builder, "transaction",
      std::string{"--payload create_claim --chain-name notary-test-chain "
                  "--nonce 7 --proof 616263 --format hex --signer "} +
          kSigner);
  auto tx = decode_hex_transaction(output);
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.nonce, 7u);
  EXPECT_EQ(tx.chain_id,
            notary::blake3::hash(std::string_view{"notary-test-chain"}));
  EXPECT_EQ(tx.signer, notary::schema::make_hash32(std::string_view{kSigner}));
  EXPECT_EQ(tx.signature, notary::schema::ed25519_signature_t{});
  ASSERT_TRUE(std::holds_alternative<notary::schema::create_claim_t>(
      tx.payload));
  EXPECT_EQ(std::get<notary::schema::create_claim_t>(tx.payload).proof,
            notary::testing::make_proof("abc"));
}

TEST(transaction_builder, transfer_claim_carries_new_owner_and_signature) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto signature_hex = std::string(128, 'a');
  auto output = run_command(
      builder, "tx",
      std::string{"--payload transfer_claim --proof 616263 --format hex "
                  "--signer "} +
          kSigner + " --new-owner " + kNewOwner + " --signature-hex " +
          signature_hex);
  auto tx = decode_hex_transaction(output);
  ASSERT_TRUE(std::holds_alternative<notary::schema::transfer_claim_t>(
      tx.payload));
  const auto& transfer = std::get<notary::schema::transfer_claim_t>(tx.payload);
  EXPECT_EQ(transfer.new_owner,
            notary::schema::make_hash32(std::string_view{kNewOwner}));
  EXPECT_EQ(transfer.proof, notary::testing::make_proof("abc"));
  EXPECT_EQ(notary::schema::to_hex(tx.signature), signature_hex);
  EXPECT_EQ(tx.chain_id,
            notary::blake3::hash(std::string_view{"notary-local"}));
}

TEST(transaction_builder, signing_payload_matches_library) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto args = std::string{"--payload revoke_claim --proof 0a0b --nonce 3 "
                          "--format hex --signer "} +
              kSigner;
  auto tx = decode_hex_transaction(run_command(builder, "transaction", args));
  auto payload = run_command(builder, "signing-payload", args);
  EXPECT_EQ(payload,
            notary::schema::to_hex(notary::execution::make_signing_payload(tx)));
}

TEST(transaction_builder, base64_and_hex_outputs_agree) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto args = std::string{"--payload create_claim --proof 616263 --signer "} +
              kSigner;
  auto base64 = run_command(builder, "transaction", args);
  auto hex = run_command(builder, "transaction", args + " --format hex");
  EXPECT_EQ(notary::schema::from_base64(base64), notary::schema::from_hex(hex));
}

TEST(transaction_builder, proof_file_hashes_contents) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto path = notary::testing::make_db_path("notary_tx_proof_file");
  {
    auto out = std::ofstream{path, std::ios::binary};
    out << "document contents";
  }
  auto output = run_command(builder, "query-key",
                            "--path /proof --format hex --proof-file " +
                                shell_quote(path));
  EXPECT_EQ(output, notary::schema::to_hex(notary::blake3::hash(
                        std::string_view{"document contents"})));
  notary::testing::remove_path(path);
}

TEST(transaction_builder, query_keys_match_route_contract) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  EXPECT_EQ(run_command(builder, "query-key",
                        "--path /proof --proof 616263 --format hex"),
            "616263");
  EXPECT_EQ(run_command(builder, "query-key",
                        std::string{"--path /nonce --format hex --signer "} +
                            kSigner),
            kSigner);
  EXPECT_EQ(
      run_command(builder, "query-key", "--path /engine/info --format hex"),
      "");
}

TEST(transaction_builder, invalid_input_fails) {
  auto builder = builder_path();
  if (builder_missing(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto [unknown_payload, ignored_1] = run_capture(
      shell_quote(builder) +
      " transaction --payload mint_claim --proof 00 --signer " + kSigner +
      " >/dev/null 2>&1");
  EXPECT_NE(unknown_payload, 0);

  auto [bad_signer, ignored_2] = run_capture(
      shell_quote(builder) +
      " transaction --payload create_claim --proof 00 --signer abcd"
      " >/dev/null 2>&1");
  EXPECT_NE(bad_signer, 0);

  auto [bad_option, ignored_3] =
      run_capture(shell_quote(builder) + " transaction --bogus >/dev/null 2>&1");
  EXPECT_EQ(bad_option, 1);
}
