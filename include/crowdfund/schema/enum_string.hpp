#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Every enum rendered in logs, events or result
// metadata specialises enum_names with a `values` array of (name, value)
// pairs; the names are part of the external interface.
namespace crowdfund::schema {

template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum>
struct enum_names;

template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  for (const auto& [candidate, value] : enum_names<Enum>::values) {
    if (candidate == name) {
      return value;
    }
  }
  return std::nullopt;
}

template <typename Enum>
constexpr std::string_view enum_name(const Enum value) {
  for (const auto& [name, candidate] : enum_names<Enum>::values) {
    if (candidate == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace crowdfund::schema
