#pragma once

#include <boost/program_options.hpp>
#include <spdlog/common.h>
#include <optional>
#include <string>

namespace ledger::cli {

/// Run configuration, all of it taken from the command line.
struct options final {
  std::string input_path;
  /// Standard output when absent.
  std::optional<std::string> output_path;
  spdlog::level::level_enum log_level{spdlog::level::warn};
  std::optional<std::string> log_file;
  bool show_help{};
};

using options_t = options;

/// Options shown by `--help`.
boost::program_options::options_description make_description();

/// Parse `ledger [options] <input> [output]`.
///
/// Returns std::nullopt with `error` set on unknown options, a missing input
/// path or an unknown log level. `show_help` short-circuits the input check.
std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       std::string& error);

}  // namespace ledger::cli
