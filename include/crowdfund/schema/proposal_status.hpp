#pragma once

#include <crowdfund/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// Review workflow: written once by the reviewer, pending -> accepted|rejected.
namespace crowdfund::schema {

enum class proposal_status_t : uint8_t { pending = 0, accepted = 1, rejected = 2 };

template <>
struct enum_names<proposal_status_t> {
  static constexpr auto values = std::array{
      enum_name_t<proposal_status_t>{"pending", proposal_status_t::pending},
      enum_name_t<proposal_status_t>{"accepted", proposal_status_t::accepted},
      enum_name_t<proposal_status_t>{"rejected", proposal_status_t::rejected}};
};

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return enum_name(value);
}

}  // namespace crowdfund::schema
