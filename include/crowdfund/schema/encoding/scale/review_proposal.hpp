#pragma once
#include <crowdfund/schema/review_proposal.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const review_proposal<1>& o, ::scale::Encoder& encoder);
void decode(review_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
