#include <ledger/schema/encoding/csv/encoder.hpp>

namespace ledger::schema::encoding {

template <>
std::string encoder<csv_encoder_tag>::header<account_state_t>() const {
  return "client,available,held,total,locked";
}

template <>
std::string encoder<csv_encoder_tag>::encode<account_state_t>(
    const account_state_t& obj) const {
  auto out = std::to_string(obj.client_id);
  out.push_back(',');
  out.append(obj.available.to_string(kAmountDisplayDigits));
  out.push_back(',');
  out.append(obj.held.to_string(kAmountDisplayDigits));
  out.push_back(',');
  out.append(obj.total.to_string(kAmountDisplayDigits));
  out.push_back(',');
  out.append(obj.locked ? "true" : "false");
  return out;
}

}  // namespace ledger::schema::encoding
