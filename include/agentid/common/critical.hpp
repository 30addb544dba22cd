#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace agentid::common {

/// Log, flush and terminate. Reserved for start-up misconfiguration that
/// leaves the process unable to serve (storage cannot open, no signing key).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace agentid::common
