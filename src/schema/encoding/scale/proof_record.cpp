#include <notary/schema/encoding/scale/proof_record.hpp>

#include <scale/scale.hpp>

namespace notary::schema {

void encode(const proof_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.created_at, encoder);
}

void decode(proof_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.created_at, decoder);
}

}  // namespace notary::schema
