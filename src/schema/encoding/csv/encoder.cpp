#include <ledger/schema/encoding/csv/encoder.hpp>

#include <algorithm>
#include <array>

namespace ledger::schema::encoding {

namespace {

inline constexpr auto kTypeColumn = std::string_view{"type"};
inline constexpr auto kClientColumn = std::string_view{"client"};
inline constexpr auto kTxColumn = std::string_view{"tx"};
inline constexpr auto kAmountColumn = std::string_view{"amount"};

bool is_blank(const char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

}  // namespace

std::string_view trim(std::string_view value) {
  while (!value.empty() && is_blank(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_blank(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

std::optional<std::vector<std::string>> split_row(const std::string_view row) {
  auto fields = std::vector<std::string>{};
  auto field = std::string{};
  auto in_quotes = false;

  for (std::size_t i = 0; i < row.size(); ++i) {
    const auto c = row[i];
    if (in_quotes) {
      if (c != '"') {
        field.push_back(c);
      } else if ((i + 1) < row.size() && row[i + 1] == '"') {
        field.push_back('"');
        ++i;
      } else {
        in_quotes = false;
      }
      continue;
    }
    if (c == ',') {
      fields.emplace_back(trim(field));
      field.clear();
    } else if (c == '"' && trim(field).empty()) {
      field.clear();
      in_quotes = true;
    } else {
      field.push_back(c);
    }
  }
  if (in_quotes) {
    return std::nullopt;
  }
  fields.emplace_back(trim(field));
  return fields;
}

bool encoder<csv_encoder_tag>::read_header(const std::string_view row,
                                           std::string& error) {
  auto fields = split_row(row);
  if (!fields) {
    error = "unterminated quoted field in header";
    return false;
  }

  auto type = std::optional<std::size_t>{};
  auto client = std::optional<std::size_t>{};
  auto tx = std::optional<std::size_t>{};
  auto amount = std::optional<std::size_t>{};
  auto columns = std::array{std::pair{kTypeColumn, &type},
                            std::pair{kClientColumn, &client},
                            std::pair{kTxColumn, &tx},
                            std::pair{kAmountColumn, &amount}};

  for (std::size_t i = 0; i < fields->size(); ++i) {
    const auto& name = (*fields)[i];
    auto column = std::ranges::find_if(
        columns, [&](const auto& entry) { return entry.first == name; });
    if (column == std::end(columns)) {
      continue;
    }
    if (column->second->has_value()) {
      error = "duplicate column '" + name + "'";
      return false;
    }
    *column->second = i;
  }

  for (const auto& [name, index] : columns) {
    if (name != kAmountColumn && !index->has_value()) {
      error = "header is missing required column '" + std::string{name} + "'";
      return false;
    }
  }

  layout = csv_layout_t{.type = type.value(),
                        .client = client.value(),
                        .tx = tx.value(),
                        .amount = amount};
  return true;
}

}  // namespace ledger::schema::encoding
