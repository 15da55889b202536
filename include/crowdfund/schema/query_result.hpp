#pragma once

#include <crowdfund/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// On failure code is a query_error_code and info its name; key echoes the
// request data either way.
namespace crowdfund::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  std::string path;
  bytes_t key;
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace crowdfund::schema
