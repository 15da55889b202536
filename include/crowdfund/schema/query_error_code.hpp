#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: query error code.
namespace crowdfund::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

template <>
struct enum_names<query_error_code> {
  static constexpr auto values = std::array{
      enum_name_t<query_error_code>{"invalid_key",
                                    query_error_code::invalid_key},
      enum_name_t<query_error_code>{"not_found", query_error_code::not_found},
      enum_name_t<query_error_code>{"unsupported_path",
                                    query_error_code::unsupported_path}};
};

inline constexpr std::string_view to_string(const query_error_code value) {
  return enum_name(value);
}

}  // namespace crowdfund::schema
