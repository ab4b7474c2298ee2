#include <gtest/gtest.h>
#include <notary/registry/claim_service.hpp>
#include <notary/registry/proof_store.hpp>
#include <notary/storage/memory/storage.hpp>
#include <notary/testing/common.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <vector>

using namespace notary::schema;
using notary::registry::claim_error;

namespace {

using memory_tag = notary::storage::memory_storage_tag;
using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

class claim_service_test : public ::testing::Test {
 protected:
  notary::registry::claim_service<memory_tag> make_service() {
    return notary::registry::claim_service<memory_tag>{
        store_, [this](const claim_event_t& event) { events_.push_back(event); },
        [this]() { return now_; }};
  }

  std::optional<proof_record_t> record_of(const proof_t& proof) const {
    return store_.get(proof);
  }

  encoder_t encoder_{};
  notary::storage::storage<memory_tag> storage_{
      notary::storage::make_storage<memory_tag>("claim_service")};
  notary::registry::proof_store<memory_tag> store_{encoder_, storage_};
  std::vector<claim_event_t> events_;
  block_height_t now_{1};

  const account_id_t alice_{notary::testing::make_account(0xA1)};
  const account_id_t bob_{notary::testing::make_account(0xB0)};
  const account_id_t carol_{notary::testing::make_account(0xC0)};
  const account_id_t dave_{notary::testing::make_account(0xD0)};
  const proof_t proof_{notary::testing::make_proof("abc")};
};

}  // namespace

TEST_F(claim_service_test, create_records_sender_and_clock) {
  auto service = make_service();
  now_ = 7;
  EXPECT_EQ(service.create_claim(alice_, proof_), std::nullopt);

  auto record = record_of(proof_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, alice_);
  EXPECT_EQ(record->created_at, 7u);

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].kind, claim_event_kind::claim_created);
  EXPECT_EQ(events_[0].sender, alice_);
  EXPECT_FALSE(events_[0].new_owner.has_value());
  EXPECT_EQ(events_[0].proof, proof_);
}

TEST_F(claim_service_test, create_twice_is_rejected_without_side_effects) {
  auto service = make_service();
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  now_ = 99;
  EXPECT_EQ(service.create_claim(bob_, proof_),
            claim_error::proof_already_claimed);
  EXPECT_EQ(service.create_claim(alice_, proof_),
            claim_error::proof_already_claimed);

  EXPECT_EQ(record_of(proof_)->owner, alice_);
  EXPECT_EQ(record_of(proof_)->created_at, 1u);
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(claim_service_test, transfer_moves_ownership_and_keeps_created_at) {
  auto service = make_service();
  now_ = 3;
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  now_ = 8;
  EXPECT_EQ(service.transfer_claim(alice_, bob_, proof_), std::nullopt);

  auto record = record_of(proof_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, bob_);
  EXPECT_EQ(record->created_at, 3u);

  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1].kind, claim_event_kind::claim_transfered);
  EXPECT_EQ(events_[1].sender, alice_);
  EXPECT_EQ(events_[1].new_owner, bob_);
  EXPECT_EQ(events_[1].proof, proof_);
}

TEST_F(claim_service_test, transfer_to_self_is_allowed) {
  auto service = make_service();
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(service.transfer_claim(alice_, alice_, proof_), std::nullopt);
  EXPECT_EQ(record_of(proof_)->owner, alice_);
  EXPECT_EQ(events_.size(), 2u);
}

TEST_F(claim_service_test, missing_proof_wins_over_ownership) {
  auto service = make_service();
  EXPECT_EQ(service.transfer_claim(bob_, carol_, proof_),
            claim_error::no_such_proof);
  EXPECT_EQ(service.revoke_claim(bob_, proof_), claim_error::no_such_proof);
  EXPECT_TRUE(events_.empty());
  EXPECT_FALSE(store_.exists(proof_));
}

TEST_F(claim_service_test, non_owner_cannot_transfer_or_revoke) {
  auto service = make_service();
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(service.transfer_claim(bob_, carol_, proof_),
            claim_error::not_proof_owner);
  EXPECT_EQ(service.revoke_claim(bob_, proof_), claim_error::not_proof_owner);
  EXPECT_EQ(record_of(proof_)->owner, alice_);
  EXPECT_EQ(events_.size(), 1u);
}

TEST_F(claim_service_test, revoke_frees_the_proof) {
  auto service = make_service();
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(service.revoke_claim(alice_, proof_), std::nullopt);
  EXPECT_FALSE(store_.exists(proof_));

  ASSERT_EQ(events_.size(), 2u);
  EXPECT_EQ(events_[1].kind, claim_event_kind::claim_revoked);
  EXPECT_EQ(events_[1].sender, alice_);
  EXPECT_FALSE(events_[1].new_owner.has_value());

  EXPECT_EQ(service.revoke_claim(alice_, proof_), claim_error::no_such_proof);
}

TEST_F(claim_service_test, ownership_follows_transfer_chain) {
  auto service = make_service();
  now_ = 10;
  EXPECT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(service.transfer_claim(bob_, dave_, proof_),
            claim_error::not_proof_owner);
  EXPECT_EQ(service.transfer_claim(alice_, carol_, proof_), std::nullopt);
  EXPECT_EQ(service.revoke_claim(alice_, proof_), claim_error::not_proof_owner);
  EXPECT_EQ(record_of(proof_)->owner, carol_);
  EXPECT_EQ(record_of(proof_)->created_at, 10u);

  now_ = 20;
  EXPECT_EQ(service.revoke_claim(carol_, proof_), std::nullopt);
  EXPECT_EQ(service.create_claim(dave_, proof_), std::nullopt);
  auto record = record_of(proof_);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->owner, dave_);
  EXPECT_EQ(record->created_at, 20u);

  auto kinds = std::vector<claim_event_kind>{};
  for (const auto& event : events_) {
    kinds.push_back(event.kind);
  }
  EXPECT_EQ(kinds, (std::vector<claim_event_kind>{
                       claim_event_kind::claim_created,
                       claim_event_kind::claim_transfered,
                       claim_event_kind::claim_revoked,
                       claim_event_kind::claim_created}));
}

TEST_F(claim_service_test, proofs_are_independent) {
  auto service = make_service();
  auto other = notary::testing::make_proof("abd");
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(service.create_claim(bob_, other), std::nullopt);
  EXPECT_EQ(service.revoke_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(record_of(other)->owner, bob_);
}

TEST_F(claim_service_test, missing_sink_still_mutates) {
  auto service =
      notary::registry::claim_service<memory_tag>{store_, {}, [] {
                                                    return block_height_t{5};
                                                  }};
  EXPECT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  EXPECT_EQ(record_of(proof_)->created_at, 5u);
  EXPECT_TRUE(events_.empty());
}

TEST_F(claim_service_test, claim_error_maps_to_transaction_codes) {
  EXPECT_EQ(notary::registry::to_string(claim_error::proof_already_claimed),
            "proof already claimed");
  EXPECT_EQ(notary::registry::to_string(claim_error::no_such_proof),
            "no such proof");
  EXPECT_EQ(notary::registry::to_string(claim_error::not_proof_owner),
            "not proof owner");
  EXPECT_NE(notary::registry::to_transaction_error_code(
                claim_error::proof_already_claimed),
            notary::registry::to_transaction_error_code(
                claim_error::no_such_proof));
  EXPECT_NE(notary::registry::to_transaction_error_code(
                claim_error::no_such_proof),
            notary::registry::to_transaction_error_code(
                claim_error::not_proof_owner));
}

TEST_F(claim_service_test, unreadable_record_is_fatal) {
  auto key = notary::schema::key::make_proof_key(encoder_, proof_);
  storage_.entries.insert_or_assign(key, bytes_t{0x01});
  auto service = make_service();
  EXPECT_DEATH(
      {
        spdlog::set_default_logger(spdlog::stderr_color_st("claim_fault"));
        static_cast<void>(service.transfer_claim(alice_, bob_, proof_));
      },
      "exists without a readable owner");
  EXPECT_DEATH(
      {
        spdlog::set_default_logger(spdlog::stderr_color_st("claim_fault"));
        static_cast<void>(service.revoke_claim(alice_, proof_));
      },
      "exists without a readable owner");
}

TEST_F(claim_service_test, record_with_unknown_version_is_fatal) {
  auto record = proof_record_t{};
  record.version = 2;
  record.owner = alice_;
  storage_.put(encoder_, notary::schema::key::make_proof_key(encoder_, proof_),
               record);
  auto service = make_service();
  EXPECT_EQ(service.create_claim(bob_, proof_),
            claim_error::proof_already_claimed);
  EXPECT_DEATH(
      {
        spdlog::set_default_logger(spdlog::stderr_color_st("claim_fault"));
        static_cast<void>(service.transfer_claim(alice_, bob_, proof_));
      },
      "exists without a readable owner");
}

TEST_F(claim_service_test, self_transfer_round_trip_matches_fresh_create) {
  auto service = make_service();
  now_ = 2;
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);
  ASSERT_EQ(service.transfer_claim(alice_, alice_, proof_), std::nullopt);
  ASSERT_EQ(service.revoke_claim(alice_, proof_), std::nullopt);
  now_ = 9;
  ASSERT_EQ(service.create_claim(alice_, proof_), std::nullopt);

  auto fresh_storage = notary::storage::make_storage<memory_tag>("fresh");
  auto fresh_store =
      notary::registry::proof_store<memory_tag>{encoder_, fresh_storage};
  auto fresh = notary::registry::claim_service<memory_tag>{
      fresh_store, {}, [] { return block_height_t{9}; }};
  ASSERT_EQ(fresh.create_claim(alice_, proof_), std::nullopt);

  storage_.save_committed_state(notary::storage::committed_state{});
  fresh_storage.save_committed_state(notary::storage::committed_state{});
  EXPECT_EQ(storage_.entries, fresh_storage.entries);
}
