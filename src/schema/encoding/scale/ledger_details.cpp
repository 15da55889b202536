#include <crowdfund/schema/encoding/scale/ledger_details.hpp>
#include <crowdfund/schema/encoding/scale/ledger_state.hpp>

namespace crowdfund::schema {

void encode(const ledger_details<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.state, encoder);
  encode(o.is_active, encoder);
  encode(o.is_successful, encoder);
}

void decode(ledger_details<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.state, decoder);
  decode(o.is_active, decoder);
  decode(o.is_successful, decoder);
}

}  // namespace crowdfund::schema
