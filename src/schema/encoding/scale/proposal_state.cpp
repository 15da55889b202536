#include <crowdfund/schema/encoding/scale/primitives.hpp>
#include <crowdfund/schema/encoding/scale/proposal_state.hpp>
#include <crowdfund/schema/encoding/scale/proposal_status.hpp>

namespace crowdfund::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.submitter, encoder);
  encode_amount(o.min_target, encoder);
  encode_amount(o.max_target, encoder);
  encode(o.window_start, encoder);
  encode(o.window_end, encoder);
  encode(o.created_at, encoder);
  encode(o.status, encoder);
  encode(o.ledger_id, encoder);
}

void decode(proposal_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.submitter, decoder);
  o.min_target = decode_amount(decoder);
  o.max_target = decode_amount(decoder);
  decode(o.window_start, decoder);
  decode(o.window_end, decoder);
  decode(o.created_at, decoder);
  decode(o.status, decoder);
  decode(o.ledger_id, decoder);
}

}  // namespace crowdfund::schema
