#pragma once

#include <spdlog/spdlog.h>
#include <ledger/execution/engine.hpp>
#include <ledger/schema/ingest_result.hpp>
#include <ledger/sink/sink.hpp>
#include <ledger/source/source.hpp>
#include <string>
#include <utility>

namespace ledger::execution {

/// Open `source` and apply every event it yields to `engine`, in order.
///
/// `ok` is false when the source could not be opened or failed while
/// reading; events applied before the failure stay applied.
template <typename Library>
ledger::schema::ingest_result_t ingest(
    ledger::source::source<Library>& source,
    ledger::execution::engine& engine) {
  auto result = ledger::schema::ingest_result_t{};
  if (!source.open(result.error)) {
    spdlog::error("Failed to open event source: {}", result.error);
    return result;
  }

  while (auto event = source.next()) {
    ++result.event_count;
    if (engine.apply(std::move(event.value()))) {
      ++result.applied_count;
    } else {
      ++result.ignored_count;
    }
  }
  result.skipped_count = source.skipped();

  if (source.failed()) {
    result.error = source.last_error();
    spdlog::error("Event source failed after {} event(s): {}",
                  result.event_count, result.error);
    return result;
  }

  result.ok = true;
  spdlog::info(
      "Ingested {} event(s): {} applied, {} ignored, {} malformed record(s) "
      "skipped",
      result.event_count, result.applied_count, result.ignored_count,
      result.skipped_count);
  return result;
}

/// Render the engine's accounts into `sink`.
template <typename Library>
bool publish(const ledger::execution::engine& engine,
             ledger::sink::sink<Library>& sink,
             std::string& error) {
  if (!sink.write_accounts(engine.accounts(), error)) {
    spdlog::error("Failed to write accounts: {}", error);
    return false;
  }
  spdlog::info("Wrote {} account(s)", engine.accounts().size());
  return true;
}

}  // namespace ledger::execution
