#pragma once

#include <ledger/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: transaction phase.
// Ledger workflow: lifecycle of one posted transaction, posted -> disputed ->
// resolved | charged_back.
namespace ledger::schema {

enum class transaction_phase_t : uint8_t {
  posted = 0,
  disputed = 1,
  resolved = 2,
  charged_back = 3
};

inline constexpr auto kTransactionPhaseMappings =
    enum_mappings_t<transaction_phase_t, 4>{{
        {"posted", transaction_phase_t::posted},
        {"disputed", transaction_phase_t::disputed},
        {"resolved", transaction_phase_t::resolved},
        {"charged_back", transaction_phase_t::charged_back}}};

template <>
struct enum_names<transaction_phase_t> final {
  static constexpr auto mappings = kTransactionPhaseMappings;
};

}  // namespace ledger::schema
