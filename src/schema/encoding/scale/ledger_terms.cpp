#include <crowdfund/schema/encoding/scale/ledger_terms.hpp>
#include <crowdfund/schema/encoding/scale/primitives.hpp>

namespace crowdfund::schema {

void encode(const ledger_terms<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.creator, encoder);
  encode_amount(o.min_target, encoder);
  encode_amount(o.max_target, encoder);
  encode(o.window_start, encoder);
  encode(o.window_end, encoder);
  encode(o.settlement_asset, encoder);
}

void decode(ledger_terms<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.creator, decoder);
  o.min_target = decode_amount(decoder);
  o.max_target = decode_amount(decoder);
  decode(o.window_start, decoder);
  decode(o.window_end, decoder);
  decode(o.settlement_asset, decoder);
}

}  // namespace crowdfund::schema
