#pragma once
#include <crowdfund/schema/transfer_reviewer_role.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace crowdfund::schema {

void encode(const transfer_reviewer_role<1>& o, ::scale::Encoder& encoder);
void decode(transfer_reviewer_role<1>& o, ::scale::Decoder& decoder);

}  // namespace crowdfund::schema
