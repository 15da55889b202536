#pragma once
#include <crowdfund/common/critical.hpp>
#include <crowdfund/schema/encoding/encoder.hpp>
#include <crowdfund/schema/encoding/scale/contribute.hpp>
#include <crowdfund/schema/encoding/scale/event_record.hpp>
#include <crowdfund/schema/encoding/scale/ledger_details.hpp>
#include <crowdfund/schema/encoding/scale/ledger_state.hpp>
#include <crowdfund/schema/encoding/scale/ledger_terms.hpp>
#include <crowdfund/schema/encoding/scale/primitives.hpp>
#include <crowdfund/schema/encoding/scale/proposal_state.hpp>
#include <crowdfund/schema/encoding/scale/proposal_status.hpp>
#include <crowdfund/schema/encoding/scale/review_proposal.hpp>
#include <crowdfund/schema/encoding/scale/settlement.hpp>
#include <crowdfund/schema/encoding/scale/submit_proposal.hpp>
#include <crowdfund/schema/encoding/scale/transaction.hpp>
#include <crowdfund/schema/encoding/scale/transaction_event.hpp>
#include <crowdfund/schema/encoding/scale/transfer_reviewer_role.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace crowdfund::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  crowdfund::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, crowdfund::schema::bytes_t& out);

  /// Decode or terminate; use for bytes this process wrote itself.
  template <typename T>
  T decode(const crowdfund::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes; std::nullopt when they are malformed.
  template <typename T>
  std::optional<T> try_decode(const crowdfund::schema::bytes_view_t& bytes);
};

template <typename T>
crowdfund::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    crowdfund::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        crowdfund::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const crowdfund::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    crowdfund::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const crowdfund::schema::bytes_view_t& bytes) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    spdlog::debug("SCALE decode rejected input: {}", ex.what());
    return std::nullopt;
  }
}

}  // namespace crowdfund::schema::encoding
