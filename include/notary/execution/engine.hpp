#pragma once

#include <notary/execution/engine_config.hpp>
#include <notary/execution/signature_verifier.hpp>
#include <notary/registry/claim_service.hpp>
#include <notary/registry/proof_store.hpp>
#include <notary/schema/app_info.hpp>
#include <notary/schema/block_result.hpp>
#include <notary/schema/claim_event.hpp>
#include <notary/schema/commit_result.hpp>
#include <notary/schema/encoding/encoder.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/query_result.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_result.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

namespace notary::execution {

/// Deterministic proof-of-existence state machine used by the ABCI server.
///
/// The engine authenticates transactions (chain id, nonce, ed25519
/// signature), bounds proof length, dispatches payloads to the claim service
/// and folds every accepted transaction into a rolling app hash.
class engine final {
 public:
  using encoder_t = notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>;
  using storage_t =
      notary::storage::storage<notary::storage::rocksdb_storage_tag>;

  /// Construct the engine over an opened store and load the last committed
  /// checkpoint from it.
  engine(encoder_t& encoder, storage_t& storage, const engine_config& config);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Decode and validation only; application state is not touched. Nonces
  /// ahead of the stored one are admitted so a signer can queue transactions.
  notary::schema::transaction_result_t check_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Validate a transaction while building or checking a proposal.
  notary::schema::transaction_result_t process_proposal_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Execute a block in order and compute its candidate app hash.
  ///
  /// Per-tx results are returned even for rejected transactions.
  notary::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<notary::schema::bytes_t>& txs);

  /// Persist the last finalized block's writes together with its height and
  /// app hash.
  notary::schema::commit_result_t commit();

  notary::schema::app_info_t info() const;

  /// Read-path query by route: /engine/info, /proof, /nonce. Answers reflect
  /// the last committed height, never a finalized but uncommitted block.
  notary::schema::query_result_t query(
      std::string_view path,
      const notary::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  const notary::schema::hash32_t& chain_id() const;
  uint32_t max_bytes_in_hash() const;

 private:
  enum class nonce_policy : uint8_t { at_least, exact };

  notary::schema::transaction_result_t admit_transaction(
      const notary::schema::bytes_view_t& raw_tx,
      std::string_view codespace);

  notary::schema::transaction_result_t validate_transaction(
      const notary::schema::transaction_t& tx,
      std::string_view codespace,
      nonce_policy policy);

  notary::schema::transaction_result_t execute_operation(
      const notary::schema::transaction_t& tx);

  uint64_t next_nonce(const notary::schema::account_id_t& signer) const;
  uint64_t committed_nonce(const notary::schema::account_id_t& signer) const;
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  engine_config config_;
  registry::proof_store<notary::storage::rocksdb_storage_tag> proofs_;
  std::vector<notary::schema::claim_event_t> emitted_;
  uint64_t current_block_height_{};
  registry::claim_service<notary::storage::rocksdb_storage_tag> claims_;
  int64_t last_committed_height_{};
  notary::schema::hash32_t last_committed_app_hash_{};
  int64_t pending_height_{};
  notary::schema::hash32_t pending_app_hash_{};
  signature_verifier_t signature_verifier_;
};

}  // namespace notary::execution
