#pragma once
#include <ledger/schema/transaction_event.hpp>
#include <ledger/source/source.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger::source {

struct memory_source_tag {};

/// Yields a prepared list of events once, in order.
template <>
struct source<memory_source_tag> final {
  std::vector<ledger::schema::transaction_event_t> events;
  std::size_t position{};
  std::string read_error;

  bool open(std::string& error) {
    static_cast<void>(error);
    return true;
  }

  std::optional<ledger::schema::transaction_event_t> next() {
    if (position >= events.size()) {
      return std::nullopt;
    }
    return std::move(events[position++]);
  }

  bool failed() const { return false; }
  const std::string& last_error() const { return read_error; }
  uint64_t skipped() const { return 0; }
};

inline source<memory_source_tag> make_memory_source(
    std::vector<ledger::schema::transaction_event_t> events) {
  auto out = source<memory_source_tag>{};
  out.events = std::move(events);
  return out;
}

}  // namespace ledger::source
