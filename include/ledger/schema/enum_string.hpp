#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace ledger::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Name table of a schema enum. Each enum specializes this next to its
/// definition with a `static constexpr` `mappings` array of (name, value)
/// pairs; the lookups below work from that table alone.
template <typename Enum>
struct enum_names;

/// Exact, case-sensitive match of `value` against the enum's names.
template <typename Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

/// Name of `value`, or "unknown" when it is outside the table.
template <typename Enum>
constexpr std::string_view to_string(const Enum value) {
  for (const auto& [name, enum_value] : enum_names<Enum>::mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace ledger::schema
