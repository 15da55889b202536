#include <crowdfund/schema/encoding/scale/primitives.hpp>

namespace crowdfund::schema {

void encode_amount(const amount_t& amount, ::scale::Encoder& encoder) {
  encode(to_amount_bytes(amount), encoder);
}

amount_t decode_amount(::scale::Decoder& decoder) {
  auto bytes = hash32_t{};
  decode(bytes, decoder);
  return from_amount_bytes(bytes);
}

}  // namespace crowdfund::schema
