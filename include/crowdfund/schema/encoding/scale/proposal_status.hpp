#pragma once
#include <crowdfund/schema/proposal_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const proposal_status_t& o, ::scale::Encoder& encoder);
void decode(proposal_status_t& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
