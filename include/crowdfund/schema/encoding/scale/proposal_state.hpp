#pragma once
#include <crowdfund/schema/proposal_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Encode/decode live in the schema namespace so the SCALE codec finds them
// through argument dependent lookup.
namespace crowdfund::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder);
void decode(proposal_state<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
