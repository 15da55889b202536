#include <crowdfund/schema/encoding/scale/settlement.hpp>

namespace crowdfund::schema {

void encode(const claim_funds<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.ledger_id, encoder);
}

void decode(claim_funds<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.ledger_id, decoder);
}

void encode(const refund<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.ledger_id, encoder);
}

void decode(refund<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.ledger_id, decoder);
}

}  // namespace crowdfund::schema
