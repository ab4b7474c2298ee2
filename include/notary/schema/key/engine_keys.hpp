#pragma once

#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for registry state and signer nonces.
namespace notary::schema::key {

inline constexpr std::string_view kProofKeyPrefix{"SYS|STATE|PROOF|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};

template <typename Encoder, typename T>
notary::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
notary::schema::bytes_t make_proof_key(
    Encoder& encoder,
    const notary::schema::bytes_view_t& proof) {
  // The proof carries a compact length prefix, so distinct proofs never share
  // a key even when one is a byte prefix of the other.
  return make_prefixed_key(encoder, kProofKeyPrefix,
                           notary::schema::make_bytes(proof));
}

template <typename Encoder>
notary::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const notary::schema::account_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

}  // namespace notary::schema::key
