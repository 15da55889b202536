#pragma once
#include <crowdfund/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const transaction_event_attribute<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event_attribute<1>& o, ::scale::Decoder& decoder);

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
