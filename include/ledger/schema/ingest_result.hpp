#pragma once

#include <cstdint>
#include <string>

// Schema type: ingest result.
// Ledger workflow: summary of one pass of an event source through the
// engine.
namespace ledger::schema {

template <uint16_t Version>
struct ingest_result;

template <>
struct ingest_result<1> final {
  uint16_t version{1};
  bool ok{};
  uint64_t event_count{};
  uint64_t applied_count{};
  uint64_t ignored_count{};
  uint64_t skipped_count{};
  std::string error;
};

using ingest_result_t = ingest_result<1>;

}  // namespace ledger::schema
