#include <crowdfund/schema/encoding/scale/ledger_state.hpp>
#include <crowdfund/schema/encoding/scale/ledger_terms.hpp>
#include <crowdfund/schema/encoding/scale/primitives.hpp>

namespace crowdfund::schema {

void encode(const ledger_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.ledger_id, encoder);
  encode(o.proposal_id, encoder);
  encode(o.terms, encoder);
  encode_amount(o.total_collected, encoder);
  encode(o.claimed, encoder);
}

void decode(ledger_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.ledger_id, decoder);
  decode(o.proposal_id, decoder);
  decode(o.terms, decoder);
  o.total_collected = decode_amount(decoder);
  decode(o.claimed, decoder);
}

}  // namespace crowdfund::schema
