#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace pharbit::common {

/// Report an unrecoverable ledger fault and terminate the process.
///
/// Reserved for structural invariant violations (corrupt stored state,
/// storage failures, replay divergence); command validation failures are
/// returned to the caller instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace pharbit::common
