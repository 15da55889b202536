#include <crowdfund/schema/encoding/scale/review_proposal.hpp>

namespace crowdfund::schema {

void encode(const review_proposal<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.approve, encoder);
}

void decode(review_proposal<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.approve, decoder);
}

}  // namespace crowdfund::schema
