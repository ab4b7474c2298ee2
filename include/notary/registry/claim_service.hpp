#pragma once

#include <notary/common/critical.hpp>
#include <notary/registry/claim_error.hpp>
#include <notary/registry/event_sink.hpp>
#include <notary/registry/proof_store.hpp>
#include <notary/schema/claim_event.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/proof_record.hpp>
#include <optional>
#include <utility>

namespace notary::registry {

/// Claim operations over an explicit proof store.
///
/// Callers pass an already-authenticated sender. Each operation returns
/// std::nullopt on success, after mutating the store and publishing one event
/// to the sink, or the first failed precondition with no side effects.
///
/// A record that exists but cannot be read back breaks the store's own
/// invariants and is treated as a fatal fault.
template <typename Library>
class claim_service final {
 public:
  claim_service(proof_store<Library>& store,
                event_sink_t sink,
                logical_clock_t clock)
      : store_{store}, sink_{std::move(sink)}, clock_{std::move(clock)} {}

  std::optional<claim_error> create_claim(
      const notary::schema::account_id_t& sender,
      const notary::schema::bytes_view_t& proof) {
    if (store_.exists(proof)) {
      return claim_error::proof_already_claimed;
    }
    auto record = notary::schema::proof_record_t{};
    record.owner = sender;
    record.created_at = clock_();
    if (!store_.insert(proof, record)) {
      notary::common::critical("proof store rejected insert of absent proof");
    }

    auto event = notary::schema::claim_event_t{};
    event.kind = notary::schema::claim_event_kind::claim_created;
    event.sender = sender;
    event.proof = notary::schema::make_bytes(proof);
    publish(event);
    return std::nullopt;
  }

  std::optional<claim_error> transfer_claim(
      const notary::schema::account_id_t& sender,
      const notary::schema::account_id_t& new_owner,
      const notary::schema::bytes_view_t& proof) {
    if (auto error = check_owner(sender, proof)) {
      return error;
    }
    if (!store_.set_owner(proof, new_owner)) {
      notary::common::critical("proof store rejected owner update");
    }

    auto event = notary::schema::claim_event_t{};
    event.kind = notary::schema::claim_event_kind::claim_transfered;
    event.sender = sender;
    event.new_owner = new_owner;
    event.proof = notary::schema::make_bytes(proof);
    publish(event);
    return std::nullopt;
  }

  std::optional<claim_error> revoke_claim(
      const notary::schema::account_id_t& sender,
      const notary::schema::bytes_view_t& proof) {
    if (auto error = check_owner(sender, proof)) {
      return error;
    }
    if (!store_.remove(proof)) {
      notary::common::critical("proof store rejected removal of known proof");
    }

    auto event = notary::schema::claim_event_t{};
    event.kind = notary::schema::claim_event_kind::claim_revoked;
    event.sender = sender;
    event.proof = notary::schema::make_bytes(proof);
    publish(event);
    return std::nullopt;
  }

 private:
  // Existence first, then ownership.
  std::optional<claim_error> check_owner(
      const notary::schema::account_id_t& sender,
      const notary::schema::bytes_view_t& proof) const {
    if (!store_.exists(proof)) {
      return claim_error::no_such_proof;
    }
    auto record = store_.get(proof);
    if (!record) {
      notary::common::critical("proof {} exists without a readable owner",
                               notary::schema::to_hex(proof));
    }
    if (record->owner != sender) {
      return claim_error::not_proof_owner;
    }
    return std::nullopt;
  }

  void publish(const notary::schema::claim_event_t& event) {
    if (sink_) {
      sink_(event);
    }
  }

  proof_store<Library>& store_;
  event_sink_t sink_;
  logical_clock_t clock_;
};

}  // namespace notary::registry
