#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string>

namespace ledger::common {

/// Install the process-wide async logger.
///
/// Diagnostics go to standard error (standard output carries the account
/// CSV) and, when `log_file` is set, to that file as well. On failure
/// `error` contains a human-readable reason and the previous default logger
/// stays in place.
bool configure_logging(spdlog::level::level_enum level,
                       const std::optional<std::string>& log_file,
                       std::string& error);

}  // namespace ledger::common
