#include <ledger/schema/encoding/csv/encoder.hpp>

#include <algorithm>
#include <charconv>

namespace ledger::schema::encoding {

namespace {

template <typename Integer>
std::optional<Integer> parse_integer(const std::string_view field) {
  auto value = Integer{};
  const auto* begin = field.data();
  const auto* end = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (field.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

template <>
std::optional<transaction_event_t>
encoder<csv_encoder_tag>::try_decode<transaction_event_t>(
    const std::string_view row,
    std::string& error) const {
  auto fields = split_row(row);
  if (!fields) {
    error = "unterminated quoted field";
    return std::nullopt;
  }

  const auto required = std::max({layout.type, layout.client, layout.tx}) + 1;
  if (fields->size() < required) {
    error = "expected at least " + std::to_string(required) +
            " fields, found " + std::to_string(fields->size());
    return std::nullopt;
  }

  const auto& type_field = (*fields)[layout.type];
  auto kind = try_from_string<transaction_kind_t>(type_field);
  if (!kind) {
    error = "unknown transaction type '" + type_field + "'";
    return std::nullopt;
  }

  const auto& client_field = (*fields)[layout.client];
  auto client_id = parse_integer<client_id_t>(client_field);
  if (!client_id) {
    error = "invalid client id '" + client_field + "'";
    return std::nullopt;
  }

  const auto& tx_field = (*fields)[layout.tx];
  auto transaction_id = parse_integer<transaction_id_t>(tx_field);
  if (!transaction_id) {
    error = "invalid transaction id '" + tx_field + "'";
    return std::nullopt;
  }

  auto event = transaction_event_t{.kind = kind.value(),
                                   .client_id = client_id.value(),
                                   .transaction_id = transaction_id.value()};

  // Amounts on dispute-family rows carry no meaning and are dropped.
  if (is_posting(event.kind) && layout.amount.has_value() &&
      layout.amount.value() < fields->size()) {
    const auto& amount_field = (*fields)[layout.amount.value()];
    if (!amount_field.empty()) {
      event.amount = decimal_t::try_parse(amount_field);
      if (!event.amount) {
        error = "invalid amount '" + amount_field + "'";
        return std::nullopt;
      }
    }
  }

  return event;
}

}  // namespace ledger::schema::encoding
