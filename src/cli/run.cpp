#include <ledger/cli/run.hpp>

#include <spdlog/spdlog.h>
#include <ledger/execution/engine.hpp>
#include <ledger/execution/pipeline.hpp>
#include <ledger/sink/csv/sink.hpp>
#include <ledger/source/csv/source.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

namespace ledger::cli {

int run(const options_t& options, std::ostream& standard_output) {
  auto engine = ledger::execution::engine{};
  auto source = ledger::source::make_source<ledger::source::csv_source_tag>(
      options.input_path);
  auto result = ledger::execution::ingest(source, engine);
  if (!result.ok) {
    spdlog::critical("Aborting: {}", result.error);
    return EXIT_FAILURE;
  }

  auto file = std::ofstream{};
  auto* out = &standard_output;
  if (options.output_path.has_value()) {
    file.open(options.output_path.value(), std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      spdlog::critical("Aborting: unable to open output '{}'",
                       options.output_path.value());
      return EXIT_FAILURE;
    }
    out = &file;
  }

  auto sink = ledger::sink::make_sink<ledger::sink::csv_sink_tag>(*out);
  auto error = std::string{};
  if (!ledger::execution::publish(engine, sink, error)) {
    spdlog::critical("Aborting: {}", error);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

}  // namespace ledger::cli
