#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace concord::common {

namespace detail {

[[noreturn]] inline void halt() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace detail

/// Log `message` at critical level, flush every logger and stop the process.
/// Reserved for broken invariants and storage failures.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  detail::halt();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg),
                   std::forward<Args>(args)...);
  detail::halt();
}

}  // namespace concord::common
