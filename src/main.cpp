#include <spdlog/spdlog.h>
#include <ledger/cli/options.hpp>
#include <ledger/cli/run.hpp>
#include <ledger/common/logging.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = ledger::cli::parse_options(argc, argv, error);
  if (!options) {
    std::cerr << "ledger: " << error << "\n\n"
              << ledger::cli::make_description() << std::endl;
    return EXIT_FAILURE;
  }
  if (options->show_help) {
    std::cout << ledger::cli::make_description() << std::endl;
    return EXIT_SUCCESS;
  }

  if (!ledger::common::configure_logging(options->log_level,
                                         options->log_file, error)) {
    std::cerr << "ledger: failed to open log file: " << error << std::endl;
    return EXIT_FAILURE;
  }

  const auto status = ledger::cli::run(options.value(), std::cout);
  spdlog::shutdown();
  return status;
}
