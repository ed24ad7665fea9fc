#pragma once
#include <ledger/schema/account_state.hpp>
#include <ledger/sink/sink.hpp>
#include <string>
#include <vector>

namespace ledger::sink {

struct memory_sink_tag {};

/// Captures rendered accounts in map order.
template <>
struct sink<memory_sink_tag> final {
  std::vector<ledger::schema::account_state_t> accounts;

  bool write_accounts(const ledger::schema::account_map_t& rows,
                      std::string& error) {
    static_cast<void>(error);
    accounts.clear();
    accounts.reserve(rows.size());
    for (const auto& row : rows) {
      accounts.push_back(row.second);
    }
    return true;
  }
};

}  // namespace ledger::sink
