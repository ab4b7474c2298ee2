#include <boost/program_options.hpp>
#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/execution/signing.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

notary::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    notary::common::critical("missing required hash argument --" + name);
  }
  auto hash = notary::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    notary::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

notary::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return notary::blake3::hash(
      std::string_view{vm["chain-name"].as<std::string>()});
}

notary::schema::bytes_t read_file(const std::string& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    notary::common::critical("cannot open proof file " + path);
  }
  return notary::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                 std::istreambuf_iterator<char>{}};
}

// A file's proof is the BLAKE3 digest of its contents.
notary::schema::proof_t get_proof(const po::variables_map& vm) {
  if (vm.contains("proof-file")) {
    auto contents = read_file(vm["proof-file"].as<std::string>());
    auto digest = notary::blake3::hash(
        notary::schema::bytes_view_t{contents.data(), contents.size()});
    return notary::schema::proof_t{std::begin(digest), std::end(digest)};
  }
  if (!vm.contains("proof")) {
    notary::common::critical("--proof or --proof-file is required");
  }
  auto proof = notary::schema::try_from_hex(vm["proof"].as<std::string>());
  if (!proof) {
    notary::common::critical("--proof must be hex");
  }
  return *proof;
}

notary::schema::ed25519_signature_t get_signature(const po::variables_map& vm) {
  auto signature = notary::schema::ed25519_signature_t{};
  auto hex = vm["signature-hex"].as<std::string>();
  if (hex.empty()) {
    return signature;
  }
  auto bytes = notary::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != signature.size()) {
    notary::common::critical("ed25519 signature must be 64 bytes of hex");
  }
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(signature));
  return signature;
}

notary::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    notary::common::critical("transaction mode requires --payload");
  }
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_claim") {
    return notary::schema::create_claim_t{.proof = get_proof(vm)};
  }
  if (payload == "transfer_claim") {
    return notary::schema::transfer_claim_t{
        .new_owner = get_hash32(vm, "new-owner"), .proof = get_proof(vm)};
  }
  if (payload == "revoke_claim") {
    return notary::schema::revoke_claim_t{.proof = get_proof(vm)};
  }
  notary::common::critical(
      "payload must be create_claim|transfer_claim|revoke_claim");
}

notary::schema::transaction_t build_transaction(const po::variables_map& vm) {
  return notary::schema::transaction_t{.version = 1,
                                       .chain_id = get_chain_id(vm),
                                       .nonce = vm["nonce"].as<uint64_t>(),
                                       .signer = get_hash32(vm, "signer"),
                                       .payload = build_payload(vm),
                                       .signature = get_signature(vm)};
}

notary::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info") {
    return {};
  }
  if (path == "/proof") {
    return get_proof(vm);
  }
  if (path == "/nonce") {
    auto signer = get_hash32(vm, "signer");
    return notary::schema::bytes_t{std::begin(signer), std::end(signer)};
  }
  notary::common::critical("path must be /engine/info|/proof|/nonce");
}

void print_bytes(const po::variables_map& vm,
                 const notary::schema::bytes_t& bytes) {
  auto format = vm["format"].as<std::string>();
  if (format == "hex") {
    std::cout << notary::schema::to_hex(bytes) << '\n';
    return;
  }
  if (format == "base64") {
    std::cout << notary::schema::to_base64(bytes) << '\n';
    return;
  }
  notary::common::critical("format must be base64|hex");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  notary_tx transaction [options]\n"
            << "  notary_tx signing-payload [options]\n"
            << "  notary_tx query-key --path /engine/info|/proof|/nonce\n"
            << "  notary_tx chain-id [--chain-name NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"notary_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "create_claim|transfer_claim|revoke_claim")(
      "path", po::value<std::string>(), "abci query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name", po::value<std::string>()->default_value("notary-local"),
      "chain name hashed into the chain id when --chain-id is absent")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "ed25519 public key hex")(
      "new-owner", po::value<std::string>(), "new owner public key hex")(
      "proof", po::value<std::string>(), "proof bytes hex")(
      "proof-file", po::value<std::string>(),
      "file whose BLAKE3 digest is the proof")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "ed25519 signature hex")(
      "format", po::value<std::string>()->default_value("base64"),
      "output encoding: base64|hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    print_bytes(vm, encoder_t{}.encode(build_transaction(vm)));
    return 0;
  }

  if (command == "signing-payload") {
    print_bytes(vm,
                notary::execution::make_signing_payload(build_transaction(vm)));
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      notary::common::critical("query-key mode requires --path");
    }
    print_bytes(vm, build_query_key(vm));
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = notary::blake3::hash(
        std::string_view{vm["chain-name"].as<std::string>()});
    std::cout << notary::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  notary::common::critical(
      "command must be transaction|signing-payload|query-key|chain-id");
}
