#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <optional>

namespace crowdfund::schema::encoding {

/// Codec facade. A wire format specialises it on its tag type and provides
/// encode, decode (terminating) and try_decode (std::nullopt on bad input).
template <typename Library>
struct encoder;

struct scale_encoder_tag;

/// The one codec used for transactions, persisted rows and query payloads.
/// Include <crowdfund/schema/encoding/scale/encoder.hpp> to use it.
using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace crowdfund::schema::encoding
