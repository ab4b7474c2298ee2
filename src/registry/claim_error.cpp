#include <notary/registry/claim_error.hpp>
#include <notary/schema/enum_string.hpp>

#include <array>
#include <utility>

namespace notary::registry {

namespace {

constexpr auto kClaimErrorNames =
    std::array<std::pair<std::string_view, claim_error>, 3>{{
        {"proof already claimed", claim_error::proof_already_claimed},
        {"no such proof", claim_error::no_such_proof},
        {"not proof owner", claim_error::not_proof_owner},
    }};

}  // namespace

std::string_view to_string(const claim_error error) {
  return notary::schema::to_string(error, kClaimErrorNames)
      .value_or("unknown claim error");
}

notary::schema::transaction_error_code to_transaction_error_code(
    const claim_error error) {
  switch (error) {
    case claim_error::proof_already_claimed:
      return notary::schema::transaction_error_code::proof_already_claimed;
    case claim_error::no_such_proof:
      return notary::schema::transaction_error_code::no_such_proof;
    case claim_error::not_proof_owner:
      return notary::schema::transaction_error_code::not_proof_owner;
  }
  return notary::schema::transaction_error_code::invalid_transaction;
}

}  // namespace notary::registry
