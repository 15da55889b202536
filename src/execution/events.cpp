#include <crowdfund/execution/events.hpp>

#include <utility>

namespace crowdfund::execution {

using namespace crowdfund::schema;

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_attribute_t attribute(std::string key,
                                        const hash32_t& value,
                                        const bool index) {
  return attribute(std::move(key), to_hex(value), index);
}

transaction_event_attribute_t attribute(std::string key,
                                        const amount_t& value,
                                        const bool index) {
  return attribute(std::move(key), to_string(value), index);
}

transaction_event_attribute_t attribute(std::string key,
                                        const uint64_t value,
                                        const bool index) {
  return attribute(std::move(key), std::to_string(value), index);
}

transaction_event_attribute_t attribute(std::string key, const bool value) {
  return attribute(std::move(key), std::string{value ? "true" : "false"},
                   false);
}

transaction_event_t make_event(
    const event_type_t type,
    std::vector<transaction_event_attribute_t> attributes) {
  return transaction_event_t{.type = std::string{to_string(type)},
                             .attributes = std::move(attributes)};
}

transaction_result_t make_failure(const transaction_error_code code,
                                  const std::string_view codespace,
                                  std::string log) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::string{to_string(code)};
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace crowdfund::execution
