#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace credo::common {

/// Log an unrecoverable registry failure, flush sinks and terminate.
///
/// Reserved for infrastructure faults (storage I/O, corrupt persisted bytes).
/// Domain failures are reported through transaction/query result codes.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace credo::common
