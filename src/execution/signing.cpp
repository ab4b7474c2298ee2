#include <notary/execution/signing.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace notary::execution {

notary::schema::bytes_t make_signing_payload(
    const notary::schema::transaction_t& tx) {
  auto encoder = notary::schema::encoding::encoder<
      notary::schema::encoding::scale_encoder_tag>{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace notary::execution
