#include <ledger/cli/options.hpp>

#include <spdlog/spdlog.h>
#include <string_view>

namespace ledger::cli {

namespace {

namespace po = boost::program_options;

std::optional<spdlog::level::level_enum> parse_level(
    const std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace

po::options_description make_description() {
  auto description =
      po::options_description{"Usage: ledger [options] <input> [output]"};
  description.add_options()("help,h", "Show the help message")(
      "output,o", po::value<std::string>(),
      "Output CSV path (standard output when omitted)")(
      "log-level,l", po::value<std::string>()->default_value("warn"),
      "Diagnostic level: trace, debug, info, warn, error, critical, off")(
      "log-file", po::value<std::string>(),
      "Also write diagnostics to this file");
  return description;
}

std::optional<options_t> parse_options(const int argc,
                                       const char* const argv[],
                                       std::string& error) {
  auto hidden = po::options_description{};
  hidden.add_options()("input", po::value<std::string>(),
                       "Input transactions CSV path");
  auto all = po::options_description{};
  all.add(make_description()).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("input", 1).add("output", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto out = options_t{};
  if (vm.contains("help")) {
    out.show_help = true;
    return out;
  }

  if (!vm.contains("input")) {
    error = "missing input path";
    return std::nullopt;
  }
  out.input_path = vm["input"].as<std::string>();

  if (vm.contains("output")) {
    out.output_path = vm["output"].as<std::string>();
  }
  if (vm.contains("log-file")) {
    out.log_file = vm["log-file"].as<std::string>();
  }

  const auto& level_name = vm["log-level"].as<std::string>();
  auto level = parse_level(level_name);
  if (!level) {
    error = "unknown log level '" + level_name + "'";
    return std::nullopt;
  }
  out.log_level = level.value();
  return out;
}

}  // namespace ledger::cli
