#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/crypto/verify.hpp>
#include <notary/execution/engine.hpp>
#include <notary/execution/signing.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/query_error_code.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace notary::schema;

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"notary.checktx"};
constexpr auto kProposalCodespace = std::string_view{"notary.proposal"};
constexpr auto kFinalizeCodespace = std::string_view{"notary.finalize"};
constexpr auto kQueryCodespace = std::string_view{"notary.query"};

notary::schema::hash32_t fold_app_hash(const notary::schema::hash32_t& seed,
                                       const notary::schema::bytes_t& tx,
                                       uint64_t height,
                                       uint64_t index) {
  auto material = notary::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return notary::blake3::hash(
      notary::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

uint16_t payload_version(const transaction_payload_t& payload) {
  return std::visit([](const auto& value) { return value.version; }, payload);
}

const proof_t& payload_proof(const transaction_payload_t& payload) {
  return std::visit(
      [](const auto& value) -> const proof_t& { return value.proof; },
      payload);
}

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const create_claim_t&) { return std::string_view{"create_claim"}; },
          [](const transfer_claim_t&) {
            return std::string_view{"transfer_claim"};
          },
          [](const revoke_claim_t&) { return std::string_view{"revoke_claim"}; },
      },
      payload);
}

}  // namespace

namespace notary::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const engine_config& config)
    : encoder_{encoder},
      storage_{storage},
      config_{config},
      proofs_{encoder, storage},
      claims_{proofs_,
              [this](const claim_event_t& event) {
                emitted_.push_back(event);
              },
              [this]() { return current_block_height_; }} {
  auto lock = std::scoped_lock{mutex_};
  if (config_.max_bytes_in_hash == 0) {
    notary::common::critical("max_bytes_in_hash must be positive");
  }
  if (config_.require_strict_crypto) {
    if (!notary::crypto::available()) {
      notary::common::critical(
          "strict crypto requested but OpenSSL lacks ed25519 support");
    }
    signature_verifier_ = notary::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; signatures will not be verified");
  }

  load_persisted_state();
  if (!storage_.load_committed_state()) {
    storage_.save_committed_state(notary::storage::committed_state{
        .height = last_committed_height_,
        .app_hash = last_committed_app_hash_});
  }
  spdlog::info("Execution engine ready at height {} (chain id {})",
               last_committed_height_, to_hex(config_.chain_id));
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  return admit_transaction(raw_tx, kCheckTxCodespace);
}

transaction_result_t engine::process_proposal_transaction(
    const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  return admit_transaction(raw_tx, kProposalCodespace);
}

transaction_result_t engine::admit_transaction(const bytes_view_t& raw_tx,
                                               const std::string_view codespace) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    spdlog::warn("Rejected undecodable transaction: {}", decode_error);
    return make_transaction_error(transaction_error_code::invalid_transaction,
                                  "invalid transaction", decode_error,
                                  codespace);
  }
  auto result =
      validate_transaction(*maybe_tx, codespace, nonce_policy::at_least);
  if (result.code != 0) {
    spdlog::warn("Rejected {} from {}: {}", payload_name(maybe_tx->payload),
                 to_hex(maybe_tx->signer), result.log);
    return result;
  }
  result.gas_wanted = 1000;
  return result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace,
    const nonce_policy policy) {
  if (tx.version != 1) {
    return make_transaction_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (payload_version(tx.payload) != 1) {
    return make_transaction_error(
        transaction_error_code::unsupported_transaction_version,
        "unsupported payload version",
        fmt::format("{} expects version 1", payload_name(tx.payload)),
        codespace);
  }
  if (tx.chain_id != config_.chain_id) {
    return make_transaction_error(transaction_error_code::invalid_chain_id,
                                  "invalid chain id", to_hex(tx.chain_id),
                                  codespace);
  }
  const auto& proof = payload_proof(tx.payload);
  if (proof.size() > config_.max_bytes_in_hash) {
    return make_transaction_error(
        transaction_error_code::proof_too_long, "proof too long",
        fmt::format("{} bytes exceeds limit of {}", proof.size(),
                    config_.max_bytes_in_hash),
        codespace);
  }

  auto expected = next_nonce(tx.signer);
  auto nonce_ok =
      policy == nonce_policy::exact ? tx.nonce == expected : tx.nonce >= expected;
  if (!nonce_ok) {
    return make_transaction_error(
        transaction_error_code::invalid_nonce, "invalid nonce",
        fmt::format("expected {}, got {}", expected, tx.nonce), codespace);
  }

  if (config_.require_strict_crypto) {
    auto message = make_signing_payload(tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return make_transaction_error(
          transaction_error_code::signature_verification_failed,
          "signature verification failed", "", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  emitted_.clear();
  auto error = std::visit(
      overloaded{
          [&](const create_claim_t& value) {
            return claims_.create_claim(tx.signer, make_bytes_view(value.proof));
          },
          [&](const transfer_claim_t& value) {
            return claims_.transfer_claim(tx.signer, value.new_owner,
                                          make_bytes_view(value.proof));
          },
          [&](const revoke_claim_t& value) {
            return claims_.revoke_claim(tx.signer,
                                        make_bytes_view(value.proof));
          }},
      tx.payload);

  if (error) {
    return make_transaction_error(registry::to_transaction_error_code(*error),
                                  std::string{registry::to_string(*error)},
                                  to_hex(payload_proof(tx.payload)),
                                  kFinalizeCodespace);
  }

  storage_.put(encoder_, key::make_nonce_key(encoder_, tx.signer),
               uint64_t{tx.nonce + 1});

  auto result = transaction_result_t{};
  result.info = fmt::format("{} accepted", payload_name(tx.payload));
  result.gas_wanted = 1000;
  result.gas_used = 750;
  for (const auto& event : emitted_) {
    result.events.push_back(make_transaction_event(event));
  }
  emitted_.clear();
  return result;
}

block_result_t engine::finalize_block(uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  // Writes of an earlier block that never reached commit are not kept.
  storage_.discard_pending();
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  current_block_height_ = height;
  result.height = height;

  auto rolling_hash = last_committed_app_hash_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto raw = bytes_view_t{txs[i].data(), txs[i].size()};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(raw, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(
          make_transaction_error(transaction_error_code::invalid_transaction,
                                 "invalid transaction", decode_error,
                                 kFinalizeCodespace));
      continue;
    }

    auto tx_result =
        validate_transaction(*maybe_tx, kFinalizeCodespace, nonce_policy::exact);
    if (tx_result.code == 0) {
      tx_result = execute_operation(*maybe_tx);
    }
    spdlog::debug("Block {} tx {} ({}) -> code {} {}", height, i,
                  payload_name(maybe_tx->payload), tx_result.code,
                  tx_result.log);
    if (tx_result.code == 0) {
      rolling_hash = fold_app_hash(rolling_hash, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_app_hash_ = rolling_hash;
  result.app_hash = rolling_hash;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_app_hash_ = pending_app_hash_;
    pending_height_ = 0;
  }

  storage_.save_committed_state(notary::storage::committed_state{
      .height = last_committed_height_, .app_hash = last_committed_app_hash_});
  spdlog::info("Committed height {} app hash {}", last_committed_height_,
               to_hex(last_committed_app_hash_));

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.app_hash = last_committed_app_hash_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_app_hash = last_committed_app_hash_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_app_hash_,
                   config_.chain_id, config_.max_bytes_in_hash});
    return result;
  }

  if (path == "/proof") {
    if (data.size() > config_.max_bytes_in_hash) {
      return make_query_error(query_error_code::invalid_key,
                              "invalid proof length", data,
                              last_committed_height_, kQueryCodespace);
    }
    auto record = proofs_.get_committed(data);
    if (!record) {
      return make_query_error(query_error_code::not_found, "proof not claimed",
                              data, last_committed_height_, kQueryCodespace);
    }
    result.value = encoder_.encode(*record);
    return result;
  }

  if (path == "/nonce") {
    if (data.size() != std::tuple_size_v<account_id_t>) {
      return make_query_error(query_error_code::invalid_key,
                              "expected 32-byte signer", data,
                              last_committed_height_, kQueryCodespace);
    }
    auto signer = account_id_t{};
    std::copy(std::begin(data), std::end(data), std::begin(signer));
    result.value = encoder_.encode(committed_nonce(signer));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          fmt::format("unsupported path '{}'", path), data,
                          last_committed_height_, kQueryCodespace);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!config_.require_strict_crypto) {
    spdlog::debug("Ignoring signature verifier; strict crypto disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
  spdlog::info("Installed custom signature verifier");
}

const hash32_t& engine::chain_id() const {
  return config_.chain_id;
}

uint32_t engine::max_bytes_in_hash() const {
  return config_.max_bytes_in_hash;
}

uint64_t engine::next_nonce(const account_id_t& signer) const {
  auto stored = storage_.get<uint64_t>(encoder_,
                                       key::make_nonce_key(encoder_, signer));
  return stored.value_or(1);
}

uint64_t engine::committed_nonce(const account_id_t& signer) const {
  auto stored = storage_.read_committed(key::make_nonce_key(encoder_, signer));
  if (!stored) {
    return 1;
  }
  return encoder_.decode<uint64_t>(make_bytes_view(*stored));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_app_hash_ = committed->app_hash;
    pending_app_hash_ = committed->app_hash;
  }
}

}  // namespace notary::execution
