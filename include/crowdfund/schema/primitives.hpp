#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace crowdfund::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
// Accounts, assets and ledgers share one 32-byte identity space.
using account_id_t = hash32_t;
using asset_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Parse 64 hex characters (optional 0x prefix); terminates on bad input.
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// The all-zero identity never names a real account or asset.
bool is_null_identity(const hash32_t& identity);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// 32-byte big-endian form of an amount; the wire and storage representation.
hash32_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const hash32_t& bytes);
std::string to_string(const amount_t& amount);

}  // namespace crowdfund::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
