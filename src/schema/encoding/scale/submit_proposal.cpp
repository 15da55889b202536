#include <crowdfund/schema/encoding/scale/primitives.hpp>
#include <crowdfund/schema/encoding/scale/submit_proposal.hpp>

namespace crowdfund::schema {

void encode(const submit_proposal<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode_amount(o.min_target, encoder);
  encode_amount(o.max_target, encoder);
  encode(o.window_start, encoder);
  encode(o.window_end, encoder);
}

void decode(submit_proposal<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  o.min_target = decode_amount(decoder);
  o.max_target = decode_amount(decoder);
  decode(o.window_start, decoder);
  decode(o.window_end, decoder);
}

}  // namespace crowdfund::schema
