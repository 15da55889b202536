#pragma once
#include <crowdfund/schema/primitives.hpp>
#include <initializer_list>
#include <string_view>

namespace crowdfund::blake3 {

crowdfund::schema::hash32_t hash(const std::string_view& str);
crowdfund::schema::hash32_t hash(const crowdfund::schema::bytes_view_t& bytes);

/// Hash the concatenation of several byte ranges without copying them.
crowdfund::schema::hash32_t hash(
    std::initializer_list<crowdfund::schema::bytes_view_t> parts);

}  // namespace crowdfund::blake3
