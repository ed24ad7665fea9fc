#include <gtest/gtest.h>
#include <ledger/schema/encoding/csv/encoder.hpp>
#include <ledger/testing/execution_harness.hpp>

#include <string>
#include <vector>

namespace {

using csv_encoder_t = ledger::schema::encoding::encoder<
    ledger::schema::encoding::csv_encoder_tag>;
using ledger::schema::transaction_event_t;
using ledger::schema::transaction_kind_t;

std::optional<transaction_event_t> decode(const csv_encoder_t& encoder,
                                          const std::string_view row) {
  auto error = std::string{};
  return encoder.try_decode<transaction_event_t>(row, error);
}

std::string decode_error(const csv_encoder_t& encoder,
                         const std::string_view row) {
  auto error = std::string{};
  auto decoded = encoder.try_decode<transaction_event_t>(row, error);
  EXPECT_FALSE(decoded.has_value()) << row;
  return error;
}

}  // namespace

TEST(encoding_types, split_row_trims_and_unquotes_fields) {
  auto fields =
      ledger::schema::encoding::split_row(" deposit , 1,\t2 ,\"3.5\"");
  ASSERT_TRUE(fields.has_value());
  EXPECT_EQ(*fields,
            (std::vector<std::string>{"deposit", "1", "2", "3.5"}));

  auto quoted = ledger::schema::encoding::split_row(
      "\"a,b\",\"say \"\"hi\"\"\",,  \"  padded \"");
  ASSERT_TRUE(quoted.has_value());
  EXPECT_EQ(*quoted,
            (std::vector<std::string>{"a,b", "say \"hi\"", "", "padded"}));
}

TEST(encoding_types, split_row_rejects_unterminated_quote) {
  EXPECT_FALSE(
      ledger::schema::encoding::split_row("deposit,\"1,2").has_value());
}

TEST(encoding_types, trim_strips_blanks_only_at_edges) {
  EXPECT_EQ(ledger::schema::encoding::trim(" \t a b\r"), "a b");
  EXPECT_EQ(ledger::schema::encoding::trim("   "), "");
}

TEST(encoding_types, decodes_rows_in_default_column_order) {
  auto encoder = csv_encoder_t{};
  auto event = decode(encoder, "deposit, 1, 7, 1.2345");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, transaction_kind_t::deposit);
  EXPECT_EQ(event->client_id, 1u);
  EXPECT_EQ(event->transaction_id, 7u);
  ASSERT_TRUE(event->amount.has_value());
  EXPECT_EQ(event->amount.value(), ledger::testing::amount("1.2345"));

  auto withdrawal = decode(encoder, "withdrawal,65535,4294967295,0.5");
  ASSERT_TRUE(withdrawal.has_value());
  EXPECT_EQ(withdrawal->client_id, 65535u);
  EXPECT_EQ(withdrawal->transaction_id, 4294967295u);
}

TEST(encoding_types, dispute_rows_never_carry_an_amount) {
  auto encoder = csv_encoder_t{};
  for (const auto* row : {"dispute,1,1", "dispute,1,1,", "resolve,1,1,",
                          "chargeback,1,1,12.5"}) {
    auto event = decode(encoder, row);
    ASSERT_TRUE(event.has_value()) << row;
    EXPECT_FALSE(event->amount.has_value()) << row;
  }
}

TEST(encoding_types, posting_without_amount_decodes_as_absent) {
  auto encoder = csv_encoder_t{};
  auto event = decode(encoder, "deposit,3,9,");
  ASSERT_TRUE(event.has_value());
  EXPECT_FALSE(event->amount.has_value());

  auto short_row = decode(encoder, "withdrawal,3,10");
  ASSERT_TRUE(short_row.has_value());
  EXPECT_FALSE(short_row->amount.has_value());
}

TEST(encoding_types, malformed_rows_report_a_reason) {
  auto encoder = csv_encoder_t{};
  EXPECT_EQ(decode_error(encoder, "transfer,1,1,1.0"),
            "unknown transaction type 'transfer'");
  EXPECT_EQ(decode_error(encoder, "Deposit,1,1,1.0"),
            "unknown transaction type 'Deposit'");
  EXPECT_EQ(decode_error(encoder, "deposit,65536,1,1.0"),
            "invalid client id '65536'");
  EXPECT_EQ(decode_error(encoder, "deposit,-1,1,1.0"),
            "invalid client id '-1'");
  EXPECT_EQ(decode_error(encoder, "deposit,1,x,1.0"),
            "invalid transaction id 'x'");
  EXPECT_EQ(decode_error(encoder, "deposit,1,4294967296,1.0"),
            "invalid transaction id '4294967296'");
  EXPECT_EQ(decode_error(encoder, "deposit,1,1,1.0.0"),
            "invalid amount '1.0.0'");
  EXPECT_EQ(decode_error(encoder, "deposit,1"),
            "expected at least 3 fields, found 2");
  EXPECT_EQ(decode_error(encoder, "deposit,\"1,1"),
            "unterminated quoted field");
}

TEST(encoding_types, header_maps_columns_by_name) {
  auto encoder = csv_encoder_t{};
  auto error = std::string{};
  ASSERT_TRUE(encoder.read_header("amount, tx, note, client, type", error))
      << error;
  EXPECT_EQ(encoder.layout.amount, 0u);
  EXPECT_EQ(encoder.layout.tx, 1u);
  EXPECT_EQ(encoder.layout.client, 3u);
  EXPECT_EQ(encoder.layout.type, 4u);

  auto event = decode(encoder, "2.5,11,ignored,4,withdrawal");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind, transaction_kind_t::withdrawal);
  EXPECT_EQ(event->client_id, 4u);
  EXPECT_EQ(event->transaction_id, 11u);
  EXPECT_EQ(event->amount.value(), ledger::testing::amount("2.5"));
}

TEST(encoding_types, header_without_amount_column_is_accepted) {
  auto encoder = csv_encoder_t{};
  auto error = std::string{};
  ASSERT_TRUE(encoder.read_header("type,client,tx", error)) << error;
  EXPECT_FALSE(encoder.layout.amount.has_value());

  auto event = decode(encoder, "deposit,1,1");
  ASSERT_TRUE(event.has_value());
  EXPECT_FALSE(event->amount.has_value());
}

TEST(encoding_types, header_rejects_missing_or_duplicate_columns) {
  auto encoder = csv_encoder_t{};
  auto error = std::string{};
  EXPECT_FALSE(encoder.read_header("type,client,amount", error));
  EXPECT_EQ(error, "header is missing required column 'tx'");

  EXPECT_FALSE(encoder.read_header("type,client,tx,type", error));
  EXPECT_EQ(error, "duplicate column 'type'");

  // A rejected header leaves the previous layout in place.
  EXPECT_EQ(encoder.layout.type, 0u);
  EXPECT_EQ(encoder.layout.amount, 3u);
}

TEST(encoding_types, encodes_account_rows_with_four_decimals) {
  auto encoder = csv_encoder_t{};
  EXPECT_EQ(encoder.header<ledger::schema::account_state_t>(),
            "client,available,held,total,locked");

  auto account = ledger::schema::account_state_t{
      .client_id = 2,
      .available = ledger::testing::amount("-5"),
      .held = ledger::testing::amount("1.23456"),
      .total = ledger::testing::amount("-3.76544"),
      .locked = true};
  EXPECT_EQ(encoder.encode(account), "2,-5.0000,1.2346,-3.7654,true");
}
