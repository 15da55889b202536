#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

// amount_t is a boost type, so it cannot take part in lookup by the codec;
// struct encoders call these explicitly. Wire form: 32 bytes, big-endian.
void encode_amount(const amount_t& amount, ::scale::Encoder& encoder);
amount_t decode_amount(::scale::Decoder& decoder);

}  // namespace crowdfund::schema
