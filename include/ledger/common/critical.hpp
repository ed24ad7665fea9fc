#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace ledger::common {

/// Report a broken internal precondition and stop the process.
///
/// The message is formatted like any spdlog call and logged at critical
/// level before the logger is flushed and shut down. Never used for bad
/// input; that is reported through return values.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace ledger::common
