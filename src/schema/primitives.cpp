#include <crowdfund/common/critical.hpp>
#include <crowdfund/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace crowdfund::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};

std::optional<uint8_t> nibble_of(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  const auto lower = static_cast<char>(c | 0x20);
  if (lower >= 'a' && lower <= 'f') {
    return static_cast<uint8_t>(lower - 'a' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    crowdfund::common::critical("expected 64 hex characters, got '{}'", hex);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != hash32_t{}.size()) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::ranges::copy(*decoded, std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_null_identity(const hash32_t& identity) {
  return std::ranges::all_of(identity, [](auto byte) { return byte == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = nibble_of(hex[i]);
    auto low = nibble_of(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

hash32_t to_amount_bytes(const amount_t& amount) {
  auto digits = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(digits), 8);
  auto out = hash32_t{};
  // export_bits emits the most significant byte first and drops leading zeros.
  std::ranges::copy(digits, std::next(std::begin(out),
                                      static_cast<std::ptrdiff_t>(
                                          out.size() - digits.size())));
  return out;
}

amount_t from_amount_bytes(const hash32_t& bytes) {
  auto amount = amount_t{};
  boost::multiprecision::import_bits(amount, std::begin(bytes), std::end(bytes),
                                     8);
  return amount;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace crowdfund::schema
