#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>

namespace notary::execution {

/// Canonical bytes an account signs: the SCALE encoding of every transaction
/// field except the signature itself.
notary::schema::bytes_t make_signing_payload(
    const notary::schema::transaction_t& tx);

}  // namespace notary::execution
