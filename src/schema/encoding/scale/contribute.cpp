#include <crowdfund/schema/encoding/scale/contribute.hpp>
#include <crowdfund/schema/encoding/scale/primitives.hpp>

namespace crowdfund::schema {

void encode(const contribute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.ledger_id, encoder);
  encode_amount(o.amount, encoder);
  encode(o.source_asset, encoder);
}

void decode(contribute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.ledger_id, decoder);
  o.amount = decode_amount(decoder);
  decode(o.source_asset, decoder);
}

}  // namespace crowdfund::schema
