#pragma once

#include <ledger/cli/options.hpp>
#include <ostream>

namespace ledger::cli {

/// Ingest `options.input_path` and write the account table.
///
/// Output goes to `options.output_path` when set and to `standard_output`
/// otherwise. Returns the process exit status: EXIT_SUCCESS, or
/// EXIT_FAILURE after logging the reason at critical level when the input
/// cannot be read or the output cannot be written. Logging must already be
/// configured; the logger is left running.
int run(const options_t& options, std::ostream& standard_output);

}  // namespace ledger::cli
