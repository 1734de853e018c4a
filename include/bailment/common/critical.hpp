#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bailment::common {

/// Log an unrecoverable condition and terminate the process.
///
/// Reserved for broken invariants (exhausted address derivation, corrupt
/// storage, unusable configuration). Caller errors are reported through
/// result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace bailment::common
