#include <crowdfund/schema/encoding/scale/contribute.hpp>
#include <crowdfund/schema/encoding/scale/review_proposal.hpp>
#include <crowdfund/schema/encoding/scale/settlement.hpp>
#include <crowdfund/schema/encoding/scale/submit_proposal.hpp>
#include <crowdfund/schema/encoding/scale/transaction.hpp>
#include <crowdfund/schema/encoding/scale/transfer_reviewer_role.hpp>

namespace crowdfund::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
}

}  // namespace crowdfund::schema
