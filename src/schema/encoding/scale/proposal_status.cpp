#include <crowdfund/schema/encoding/scale/proposal_status.hpp>

#include <stdexcept>

namespace crowdfund::schema {

void encode(const proposal_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(proposal_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(proposal_status_t::rejected)) {
    throw std::invalid_argument{"unknown proposal status"};
  }
  o = static_cast<proposal_status_t>(raw);
}

}  // namespace crowdfund::schema
