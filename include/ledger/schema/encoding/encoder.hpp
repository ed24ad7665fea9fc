#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ledger::schema::encoding {

// Encoders are selected at build time by tag, e.g.
// `encoder<csv_encoder_tag>`. Each specialization maps schema types to rows
// of its text format.
template <typename Library>
struct encoder {
  /// Column names for rows of `T`.
  template <typename T>
  std::string header() const;

  template <typename T>
  std::string encode(const T& obj) const;

  /// Decode a row, or return std::nullopt with `error` describing why not.
  template <typename T>
  std::optional<T> try_decode(std::string_view row, std::string& error) const;
};

}  // namespace ledger::schema::encoding
