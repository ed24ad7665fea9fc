#pragma once
#include <ledger/schema/account_state.hpp>
#include <ledger/schema/encoding/csv/encoder.hpp>
#include <ledger/sink/sink.hpp>
#include <ostream>
#include <string>

namespace ledger::sink {

struct csv_sink_tag {};

template <>
struct sink<csv_sink_tag> final {
  std::ostream* stream{nullptr};
  ledger::schema::encoding::encoder<
      ledger::schema::encoding::csv_encoder_tag>
      codec;

  bool write_accounts(const ledger::schema::account_map_t& accounts,
                      std::string& error);
};

template <>
sink<csv_sink_tag> make_sink<csv_sink_tag>(std::ostream& stream);

}  // namespace ledger::sink
