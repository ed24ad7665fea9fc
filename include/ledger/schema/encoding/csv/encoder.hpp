#pragma once
#include <ledger/schema/account_state.hpp>
#include <ledger/schema/encoding/encoder.hpp>
#include <ledger/schema/transaction_event.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledger::schema::encoding {

/// Column positions of a transaction row. The defaults are the canonical
/// `type,client,tx,amount` order; `read_header` replaces them.
struct csv_layout final {
  std::size_t type{0};
  std::size_t client{1};
  std::size_t tx{2};
  std::optional<std::size_t> amount{3};
};

using csv_layout_t = csv_layout;

/// Split a row on commas. Fields are trimmed; double-quoted fields may
/// contain commas and `""` escapes. Returns std::nullopt on an unterminated
/// quote.
std::optional<std::vector<std::string>> split_row(std::string_view row);

/// Strip leading and trailing spaces, tabs and carriage returns.
std::string_view trim(std::string_view value);

struct csv_encoder_tag {};

template <>
struct encoder<csv_encoder_tag> final {
  csv_layout_t layout;

  /// Map column names of a transaction header row onto `layout`.
  ///
  /// `type`, `client` and `tx` are required; `amount` is optional and unknown
  /// columns are ignored. On failure `layout` is left untouched.
  bool read_header(std::string_view row, std::string& error);

  template <typename T>
  std::string header() const;

  template <typename T>
  std::string encode(const T& obj) const;

  template <typename T>
  std::optional<T> try_decode(std::string_view row, std::string& error) const;
};

template <>
std::string encoder<csv_encoder_tag>::header<account_state_t>() const;

template <>
std::string encoder<csv_encoder_tag>::encode<account_state_t>(
    const account_state_t& obj) const;

template <>
std::optional<transaction_event_t>
encoder<csv_encoder_tag>::try_decode<transaction_event_t>(
    std::string_view row,
    std::string& error) const;

}  // namespace ledger::schema::encoding
