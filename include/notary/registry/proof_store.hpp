#pragma once

#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/proof_record.hpp>
#include <notary/storage/storage.hpp>
#include <optional>

namespace notary::registry {

/// Authoritative owner of the proof -> record mapping.
///
/// Every read and write of claim state goes through this type. Mutators
/// return false, and change nothing, when their precondition does not hold.
/// No events are produced here.
template <typename Library>
class proof_store final {
 public:
  using encoder_t = notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>;
  using storage_t = notary::storage::storage<Library>;

  proof_store(encoder_t& encoder, storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  bool exists(const notary::schema::bytes_view_t& proof) const {
    return storage_.contains(key_for(proof));
  }

  /// The record for proof, or std::nullopt when absent. Stored bytes that do
  /// not decode as a version 1 record also read back as std::nullopt; callers
  /// that already saw exists() treat that as corruption.
  std::optional<notary::schema::proof_record_t> get(
      const notary::schema::bytes_view_t& proof) const {
    auto bytes = storage_.read(key_for(proof));
    if (!bytes) {
      return std::nullopt;
    }
    return decode_record(*bytes);
  }

  /// Same as get, but against the last checkpoint only.
  std::optional<notary::schema::proof_record_t> get_committed(
      const notary::schema::bytes_view_t& proof) const {
    auto bytes = storage_.read_committed(key_for(proof));
    if (!bytes) {
      return std::nullopt;
    }
    return decode_record(*bytes);
  }

  /// Insert a fresh record. Fails when a record already exists.
  bool insert(const notary::schema::bytes_view_t& proof,
              const notary::schema::proof_record_t& record) {
    auto key = key_for(proof);
    if (storage_.contains(key)) {
      return false;
    }
    storage_.put(encoder_, key, record);
    return true;
  }

  /// Replace the owner, keeping created_at. Fails when no record exists.
  bool set_owner(const notary::schema::bytes_view_t& proof,
                 const notary::schema::account_id_t& new_owner) {
    auto record = get(proof);
    if (!record) {
      return false;
    }
    record->owner = new_owner;
    storage_.put(encoder_, key_for(proof), *record);
    return true;
  }

  /// Delete the record. Fails when no record exists.
  bool remove(const notary::schema::bytes_view_t& proof) {
    auto key = key_for(proof);
    if (!storage_.contains(key)) {
      return false;
    }
    storage_.erase(key);
    return true;
  }

 private:
  std::optional<notary::schema::proof_record_t> decode_record(
      const notary::schema::bytes_t& bytes) const {
    auto record = encoder_.template try_decode<notary::schema::proof_record_t>(
        notary::schema::make_bytes_view(bytes));
    if (!record || record->version != 1) {
      return std::nullopt;
    }
    return record;
  }

  notary::schema::bytes_t key_for(
      const notary::schema::bytes_view_t& proof) const {
    return notary::schema::key::make_proof_key(encoder_, proof);
  }

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace notary::registry
