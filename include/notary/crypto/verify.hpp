#pragma once

#include <notary/schema/primitives.hpp>

namespace notary::crypto {

bool available();

/// Verify an ed25519 signature over message with the signer's public key.
bool verify_signature(const notary::schema::bytes_view_t& message,
                      const notary::schema::account_id_t& signer,
                      const notary::schema::ed25519_signature_t& signature);

}  // namespace notary::crypto
