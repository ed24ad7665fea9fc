#pragma once
#include <ledger/schema/account_state.hpp>
#include <ostream>
#include <string>

namespace ledger::sink {

/// Consumer of the final account map, selected by tag
/// (`sink<csv_sink_tag>`).
template <typename Library>
struct sink {
  /// Render every account. On failure, `error` contains a human-readable
  /// reason.
  bool write_accounts(const ledger::schema::account_map_t& accounts,
                      std::string& error);
};

/// Construct a stream-backed sink. The stream is borrowed and must outlive
/// the sink.
template <typename Library>
sink<Library> make_sink(std::ostream& stream);

}  // namespace ledger::sink
