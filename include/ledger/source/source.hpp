#pragma once
#include <ledger/schema/transaction_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ledger::source {

/// Single-pass producer of transaction events.
///
/// Backends are selected by tag (`source<csv_source_tag>`). A source yields
/// well-formed events only; malformed records are logged and counted in
/// `skipped()`. Sources are not restartable.
template <typename Library>
struct source {
  /// Acquire the origin. On failure, `error` contains a human-readable
  /// reason.
  bool open(std::string& error);

  /// Next event in origin order, or std::nullopt once exhausted or failed.
  std::optional<ledger::schema::transaction_event_t> next();

  /// True when the sequence ended because of a read error.
  bool failed() const;

  /// Reason for `failed()`; empty otherwise.
  const std::string& last_error() const;

  /// Malformed records dropped so far.
  uint64_t skipped() const;
};

/// Construct a file-backed source for `path`. The file is not touched until
/// `open`.
template <typename Library>
source<Library> make_source(const std::string_view& path);

}  // namespace ledger::source
