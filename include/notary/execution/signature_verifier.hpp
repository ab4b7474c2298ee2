#pragma once

#include <notary/schema/primitives.hpp>
#include <functional>

namespace notary::execution {

using signature_verifier_t =
    std::function<bool(const notary::schema::bytes_view_t& message,
                       const notary::schema::account_id_t& signer,
                       const notary::schema::ed25519_signature_t& signature)>;

}  // namespace notary::execution
