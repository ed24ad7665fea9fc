#pragma once

#include <ledger/schema/primitives.hpp>
#include <cstdint>
#include <map>

// Schema type: account state.
// Ledger workflow: per-client balances. `total` always equals
// `available + held`; `locked` is set by a chargeback and never cleared.
namespace ledger::schema {

template <uint16_t Version>
struct account_state;

template <>
struct account_state<1> final {
  uint16_t version{1};
  client_id_t client_id{};
  amount_t available;
  amount_t held;
  amount_t total;
  bool locked{};
};

using account_state_t = account_state<1>;
using account_map_t = std::map<client_id_t, account_state_t>;

}  // namespace ledger::schema
