#pragma once
#include <notary/schema/create_claim.hpp>
#include <notary/schema/revoke_claim.hpp>
#include <notary/schema/transfer_claim.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace notary::schema {

void encode(const create_claim<1>& o, ::scale::Encoder& encoder);
void decode(create_claim<1>& o, ::scale::Decoder& decoder);

void encode(const transfer_claim<1>& o, ::scale::Encoder& encoder);
void decode(transfer_claim<1>& o, ::scale::Decoder& decoder);

void encode(const revoke_claim<1>& o, ::scale::Encoder& encoder);
void decode(revoke_claim<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
