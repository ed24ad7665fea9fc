#pragma once
#include <ledger/schema/encoding/csv/encoder.hpp>
#include <ledger/schema/transaction_event.hpp>
#include <ledger/source/source.hpp>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ledger::source {

struct csv_source_tag {};

template <>
struct source<csv_source_tag> final {
  std::string path;
  std::unique_ptr<std::ifstream> stream;
  ledger::schema::encoding::encoder<
      ledger::schema::encoding::csv_encoder_tag>
      codec;
  uint64_t line_number{};
  uint64_t skipped_count{};
  bool header_read{};
  std::string read_error;

  bool open(std::string& error);
  std::optional<ledger::schema::transaction_event_t> next();
  bool failed() const { return !read_error.empty(); }
  const std::string& last_error() const { return read_error; }
  uint64_t skipped() const { return skipped_count; }
};

template <>
source<csv_source_tag> make_source<csv_source_tag>(const std::string_view& path);

}  // namespace ledger::source
