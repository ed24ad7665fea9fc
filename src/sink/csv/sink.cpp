#include <ledger/sink/csv/sink.hpp>

namespace ledger::sink {

template <>
sink<csv_sink_tag> make_sink<csv_sink_tag>(std::ostream& stream) {
  auto out = sink<csv_sink_tag>{};
  out.stream = &stream;
  return out;
}

bool sink<csv_sink_tag>::write_accounts(
    const ledger::schema::account_map_t& accounts,
    std::string& error) {
  if (stream == nullptr) {
    error = "CSV sink has no output stream";
    return false;
  }

  *stream << codec.header<ledger::schema::account_state_t>() << '\n';
  for (const auto& [client_id, account] : accounts) {
    static_cast<void>(client_id);
    *stream << codec.encode(account) << '\n';
  }
  stream->flush();

  if (!stream->good()) {
    error = "failed writing account rows";
    return false;
  }
  return true;
}

}  // namespace ledger::sink
