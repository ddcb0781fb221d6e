#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace warden::common {

/// Log an unrecoverable infrastructure fault and stop the node.
///
/// Reserved for failures that leave the process unable to honour the
/// atomicity of committed state (storage open/read/write, codec faults).
/// Escrow rule violations never end up here; they are reported as
/// transaction result codes.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace warden::common
