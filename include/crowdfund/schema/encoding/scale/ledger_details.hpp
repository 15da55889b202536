#pragma once
#include <crowdfund/schema/ledger_details.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const ledger_details<1>& o, ::scale::Encoder& encoder);
void decode(ledger_details<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
