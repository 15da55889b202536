#pragma once
#include <crowdfund/schema/contribute.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const contribute<1>& o, ::scale::Encoder& encoder);
void decode(contribute<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
