#include <notary/schema/encoding/scale/claim_payloads.hpp>

#include <scale/scale.hpp>

namespace notary::schema {

void encode(const create_claim<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proof, encoder);
}

void decode(create_claim<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proof, decoder);
}

void encode(const transfer_claim<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
  encode(o.proof, encoder);
}

void decode(transfer_claim<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
  decode(o.proof, decoder);
}

void encode(const revoke_claim<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proof, encoder);
}

void decode(revoke_claim<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proof, decoder);
}

}  // namespace notary::schema
