#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Outcome of one registry or ledger call. code 0 is success; otherwise code is
// a transaction_error_code and info carries its name.
namespace crowdfund::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  // submit_proposal: SCALE-encoded proposal id.
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
  // Sequence ids given to `events` by the engine; empty outside a block.
  std::vector<uint64_t> event_ids;
};

using transaction_result_t = transaction_result<1>;

}  // namespace crowdfund::schema
