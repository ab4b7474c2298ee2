#pragma once

#include <notary/blake3/hash.hpp>
#include <notary/execution/engine.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <notary/testing/common.hpp>
#include <notary/testing/execution_harness.hpp>

#include <string>
#include <string_view>

namespace notary::testing {

inline notary::schema::hash32_t default_chain_id() {
  return notary::blake3::hash(std::string_view{"notary-test-chain"});
}

inline notary::execution::engine_config make_engine_config(
    const bool strict_crypto,
    const uint32_t max_bytes_in_hash = 64) {
  return notary::execution::engine_config{
      .chain_id = default_chain_id(),
      .max_bytes_in_hash = max_bytes_in_hash,
      .require_strict_crypto = strict_crypto};
}

/// RocksDB-backed engine in a throwaway directory, removed on destruction.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false,
                             const uint32_t max_bytes_in_hash = 64)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{notary::storage::make_storage<
            notary::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_,
                make_engine_config(strict_crypto, max_bytes_in_hash)} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    storage_.pending.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  notary::storage::storage<notary::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  notary::execution::engine& engine() { return engine_; }

  notary::schema::hash32_t chain_id() { return chain_id_from_engine(engine_); }

  static notary::execution::signature_verifier_t allow_all_verifier() {
    return [](const notary::schema::bytes_view_t&,
              const notary::schema::account_id_t&,
              const notary::schema::ed25519_signature_t&) { return true; };
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  notary::storage::storage<notary::storage::rocksdb_storage_tag> storage_;
  notary::execution::engine engine_;
};

}  // namespace notary::testing
