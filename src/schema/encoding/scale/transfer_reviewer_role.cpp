#include <crowdfund/schema/encoding/scale/transfer_reviewer_role.hpp>

namespace crowdfund::schema {

void encode(const transfer_reviewer_role<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.new_reviewer, encoder);
}

void decode(transfer_reviewer_role<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.new_reviewer, decoder);
}

}  // namespace crowdfund::schema
