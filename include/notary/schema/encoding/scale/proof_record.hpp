#pragma once
#include <notary/schema/proof_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared beside the type so the codec finds them by argument-dependent
// lookup.
namespace notary::schema {

void encode(const proof_record<1>& o, ::scale::Encoder& encoder);
void decode(proof_record<1>& o, ::scale::Decoder& decoder);

}  // namespace notary::schema
