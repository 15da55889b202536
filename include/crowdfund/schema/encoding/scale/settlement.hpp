#pragma once
#include <crowdfund/schema/settlement.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const claim_funds<1>& o, ::scale::Encoder& encoder);
void decode(claim_funds<1>& o, ::scale::Decoder& decoder);

void encode(const refund<1>& o, ::scale::Encoder& encoder);
void decode(refund<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
