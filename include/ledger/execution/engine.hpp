#pragma once

#include <ledger/schema/account_state.hpp>
#include <ledger/schema/primitives.hpp>
#include <ledger/schema/transaction_event.hpp>
#include <ledger/schema/transaction_phase.hpp>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ledger::execution {

/// Events seen for one (client, transaction) pair, in arrival order.
using history_bucket_t = std::vector<ledger::schema::transaction_event_t>;
using client_history_t =
    std::unordered_map<ledger::schema::transaction_id_t, history_bucket_t>;
using history_index_t =
    std::unordered_map<ledger::schema::client_id_t, client_history_t>;

/// Deterministic account state machine.
///
/// The engine applies deposit, withdrawal, dispute, resolve and chargeback
/// events in arrival order. Every event is appended to the history index
/// after it is applied, whether or not it changed any balance; later
/// dispute-family events look their posting up there. References that do
/// not resolve are ignored rather than reported.
class engine final {
 public:
  engine() = default;

  /// Apply one event and record it in the history index.
  ///
  /// Returns true when the event changed account state. A false return is a
  /// business-rule no-op (unknown transaction, insufficient funds, resolve
  /// without dispute), never an error.
  bool apply(ledger::schema::transaction_event_t event);

  /// Current state of every account, ordered by client id.
  const ledger::schema::account_map_t& accounts() const;

  std::optional<ledger::schema::account_state_t> account(
      ledger::schema::client_id_t client_id) const;

  /// Events recorded for (client, transaction), in arrival order.
  std::optional<history_bucket_t> history(
      ledger::schema::client_id_t client_id,
      ledger::schema::transaction_id_t transaction_id) const;

  /// Lifecycle view of a posted transaction.
  ///
  /// std::nullopt when no deposit or withdrawal was recorded under
  /// (client, transaction).
  std::optional<ledger::schema::transaction_phase_t> phase(
      ledger::schema::client_id_t client_id,
      ledger::schema::transaction_id_t transaction_id) const;

 private:
  bool apply_deposit(const ledger::schema::transaction_event_t& event);
  bool apply_withdrawal(const ledger::schema::transaction_event_t& event);
  bool apply_dispute(const ledger::schema::transaction_event_t& event);
  bool apply_resolve(const ledger::schema::transaction_event_t& event);
  bool apply_chargeback(const ledger::schema::transaction_event_t& event);

  const history_bucket_t* find_bucket(
      ledger::schema::client_id_t client_id,
      ledger::schema::transaction_id_t transaction_id) const;

  ledger::schema::account_state_t& get_or_create_account(
      ledger::schema::client_id_t client_id);

  ledger::schema::account_map_t accounts_;
  history_index_t history_;
};

}  // namespace ledger::execution
