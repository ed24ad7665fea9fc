#pragma once

#include <ledger/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: transaction kind.
// Ledger workflow: the five event types of the input log. Deposits and
// withdrawals post funds; the rest reference an earlier posting.
namespace ledger::schema {

enum class transaction_kind_t : uint8_t {
  deposit = 0,
  withdrawal = 1,
  dispute = 2,
  resolve = 3,
  chargeback = 4
};

inline constexpr auto kTransactionKindMappings =
    enum_mappings_t<transaction_kind_t, 5>{{
        {"deposit", transaction_kind_t::deposit},
        {"withdrawal", transaction_kind_t::withdrawal},
        {"dispute", transaction_kind_t::dispute},
        {"resolve", transaction_kind_t::resolve},
        {"chargeback", transaction_kind_t::chargeback}}};

template <>
struct enum_names<transaction_kind_t> final {
  static constexpr auto mappings = kTransactionKindMappings;
};

/// Deposits and withdrawals carry an amount and open a history bucket.
inline constexpr bool is_posting(const transaction_kind_t value) {
  return value == transaction_kind_t::deposit ||
         value == transaction_kind_t::withdrawal;
}

}  // namespace ledger::schema
