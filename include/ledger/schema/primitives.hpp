#pragma once
#include <ledger/schema/decimal.hpp>
#include <cstdint>

namespace ledger::schema {

using client_id_t = uint16_t;
using transaction_id_t = uint32_t;
using amount_t = decimal_t;

/// Fractional digits used whenever an amount is rendered.
inline constexpr auto kAmountDisplayDigits = uint32_t{4};

}  // namespace ledger::schema
