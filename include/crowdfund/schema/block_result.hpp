#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <crowdfund/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema types: block result and commit result.
namespace crowdfund::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  uint64_t height{};
  timestamp_milliseconds_t block_time{};
  std::vector<transaction_result_t> tx_results;
  uint64_t events_emitted{};
  // Candidate root; becomes the committed root on the next commit.
  hash32_t state_root;
};

using block_result_t = block_result<1>;

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root;
  uint64_t events_persisted{};
};

using commit_result_t = commit_result<1>;

}  // namespace crowdfund::schema
