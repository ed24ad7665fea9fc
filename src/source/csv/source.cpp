#include <spdlog/spdlog.h>
#include <ledger/common/critical.hpp>
#include <ledger/source/csv/source.hpp>

#include <filesystem>
#include <system_error>

namespace ledger::source {

namespace {

inline constexpr auto kUtf8ByteOrderMark = std::string_view{"\xEF\xBB\xBF"};

}  // namespace

template <>
source<csv_source_tag> make_source<csv_source_tag>(
    const std::string_view& path) {
  auto out = source<csv_source_tag>{};
  out.path = std::string{path};
  return out;
}

bool source<csv_source_tag>::open(std::string& error) {
  auto status_error = std::error_code{};
  if (std::filesystem::is_directory(path, status_error)) {
    error = "'" + path + "' is a directory";
    return false;
  }

  auto file = std::make_unique<std::ifstream>(path);
  if (!file->is_open()) {
    error = "unable to open '" + path + "'";
    return false;
  }
  stream = std::move(file);
  line_number = 0;
  skipped_count = 0;
  header_read = false;
  read_error.clear();
  spdlog::info("Reading transactions from '{}'", path);
  return true;
}

std::optional<ledger::schema::transaction_event_t>
source<csv_source_tag>::next() {
  if (!stream) {
    ledger::common::critical("CSV source for '{}' read before open", path);
  }
  if (failed()) {
    return std::nullopt;
  }

  auto line = std::string{};
  while (std::getline(*stream, line)) {
    ++line_number;
    auto row = ledger::schema::encoding::trim(line);
    if (line_number == 1 && row.starts_with(kUtf8ByteOrderMark)) {
      row.remove_prefix(kUtf8ByteOrderMark.size());
    }
    if (row.empty()) {
      continue;
    }

    auto error = std::string{};
    if (!header_read) {
      if (!codec.read_header(row, error)) {
        read_error = "invalid header in '" + path + "': " + error;
        return std::nullopt;
      }
      header_read = true;
      continue;
    }

    auto event =
        codec.try_decode<ledger::schema::transaction_event_t>(row, error);
    if (!event) {
      ++skipped_count;
      spdlog::warn("Skipping malformed record at {}:{}: {}", path, line_number,
                   error);
      continue;
    }
    return event;
  }

  if (stream->bad()) {
    read_error = "failed reading '" + path + "' after line " +
                 std::to_string(line_number);
  }
  return std::nullopt;
}

}  // namespace ledger::source
