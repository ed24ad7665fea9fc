#pragma once

#include <ledger/schema/primitives.hpp>
#include <ledger/schema/transaction_kind.hpp>
#include <cstdint>
#include <optional>

// Schema type: transaction event.
// Ledger workflow: one row of the input log. `amount` is only present on
// deposits and withdrawals.
namespace ledger::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  transaction_kind_t kind{transaction_kind_t::deposit};
  client_id_t client_id{};
  transaction_id_t transaction_id{};
  std::optional<amount_t> amount;
};

using transaction_event_t = transaction_event<1>;

}  // namespace ledger::schema
