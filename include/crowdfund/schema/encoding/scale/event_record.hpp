#pragma once
#include <crowdfund/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
