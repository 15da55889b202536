#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace crowdfund::common {

/// Log an unrecoverable infrastructure failure, flush the loggers and stop.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg),
                   std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace crowdfund::common
