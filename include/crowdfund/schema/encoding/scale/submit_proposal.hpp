#pragma once
#include <crowdfund/schema/submit_proposal.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const submit_proposal<1>& o, ::scale::Encoder& encoder);
void decode(submit_proposal<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
