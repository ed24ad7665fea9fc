#include <ledger/execution/engine.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace ledger::schema;

namespace {

std::optional<amount_t> posted_amount(
    const ledger::execution::history_bucket_t& bucket) {
  auto posting = std::ranges::find_if(
      bucket, [](const auto& event) { return is_posting(event.kind); });
  if (posting == std::end(bucket)) {
    return std::nullopt;
  }
  return posting->amount.value_or(amount_t{});
}

bool has_dispute(const ledger::execution::history_bucket_t& bucket) {
  return std::ranges::any_of(bucket, [](const auto& event) {
    return event.kind == transaction_kind_t::dispute;
  });
}

void recompute_total(account_state_t& account) {
  account.total = account.available + account.held;
}

}  // namespace

namespace ledger::execution {

bool engine::apply(transaction_event_t event) {
  auto applied = false;
  switch (event.kind) {
    case transaction_kind_t::deposit:
      applied = apply_deposit(event);
      break;
    case transaction_kind_t::withdrawal:
      applied = apply_withdrawal(event);
      break;
    case transaction_kind_t::dispute:
      applied = apply_dispute(event);
      break;
    case transaction_kind_t::resolve:
      applied = apply_resolve(event);
      break;
    case transaction_kind_t::chargeback:
      applied = apply_chargeback(event);
      break;
  }

  auto& bucket = history_[event.client_id][event.transaction_id];
  bucket.push_back(std::move(event));
  return applied;
}

const account_map_t& engine::accounts() const {
  return accounts_;
}

std::optional<account_state_t> engine::account(
    const client_id_t client_id) const {
  auto it = accounts_.find(client_id);
  if (it == std::end(accounts_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<history_bucket_t> engine::history(
    const client_id_t client_id,
    const transaction_id_t transaction_id) const {
  const auto* bucket = find_bucket(client_id, transaction_id);
  if (bucket == nullptr) {
    return std::nullopt;
  }
  return *bucket;
}

std::optional<transaction_phase_t> engine::phase(
    const client_id_t client_id,
    const transaction_id_t transaction_id) const {
  const auto* bucket = find_bucket(client_id, transaction_id);
  if (bucket == nullptr) {
    return std::nullopt;
  }
  auto posting = std::ranges::find_if(
      *bucket, [](const auto& event) { return is_posting(event.kind); });
  if (posting == std::end(*bucket)) {
    return std::nullopt;
  }

  auto current = transaction_phase_t::posted;
  for (auto it = std::next(posting); it != std::end(*bucket); ++it) {
    switch (it->kind) {
      case transaction_kind_t::dispute:
        if (current == transaction_phase_t::posted) {
          current = transaction_phase_t::disputed;
        }
        break;
      case transaction_kind_t::resolve:
        if (current == transaction_phase_t::disputed) {
          current = transaction_phase_t::resolved;
        }
        break;
      case transaction_kind_t::chargeback:
        if (current == transaction_phase_t::disputed) {
          current = transaction_phase_t::charged_back;
        }
        break;
      case transaction_kind_t::deposit:
      case transaction_kind_t::withdrawal:
        break;
    }
  }
  return current;
}

bool engine::apply_deposit(const transaction_event_t& event) {
  auto& account = get_or_create_account(event.client_id);
  account.available += event.amount.value_or(amount_t{});
  recompute_total(account);
  return true;
}

bool engine::apply_withdrawal(const transaction_event_t& event) {
  auto it = accounts_.find(event.client_id);
  if (it == std::end(accounts_)) {
    return false;
  }
  auto& account = it->second;
  const auto amount = event.amount.value_or(amount_t{});
  if (account.available < amount) {
    return false;
  }
  account.available -= amount;
  recompute_total(account);
  return true;
}

bool engine::apply_dispute(const transaction_event_t& event) {
  const auto* bucket = find_bucket(event.client_id, event.transaction_id);
  if (bucket == nullptr) {
    return false;
  }
  const auto amount = posted_amount(*bucket);
  if (!amount) {
    return false;
  }
  auto& account = get_or_create_account(event.client_id);
  account.available -= amount.value();
  account.held += amount.value();
  recompute_total(account);
  return true;
}

bool engine::apply_resolve(const transaction_event_t& event) {
  const auto* bucket = find_bucket(event.client_id, event.transaction_id);
  if (bucket == nullptr || !has_dispute(*bucket)) {
    return false;
  }
  const auto amount = posted_amount(*bucket);
  if (!amount) {
    return false;
  }
  auto it = accounts_.find(event.client_id);
  if (it == std::end(accounts_)) {
    return false;
  }
  auto& account = it->second;
  account.held -= amount.value();
  account.available += amount.value();
  recompute_total(account);
  return true;
}

bool engine::apply_chargeback(const transaction_event_t& event) {
  const auto* bucket = find_bucket(event.client_id, event.transaction_id);
  if (bucket == nullptr || !has_dispute(*bucket)) {
    return false;
  }
  const auto amount = posted_amount(*bucket);
  if (!amount) {
    return false;
  }
  auto it = accounts_.find(event.client_id);
  if (it == std::end(accounts_)) {
    return false;
  }
  auto& account = it->second;
  account.held -= amount.value();
  account.available -= amount.value();
  account.locked = true;
  recompute_total(account);
  return true;
}

const history_bucket_t* engine::find_bucket(
    const client_id_t client_id,
    const transaction_id_t transaction_id) const {
  auto client = history_.find(client_id);
  if (client == std::end(history_)) {
    return nullptr;
  }
  auto bucket = client->second.find(transaction_id);
  if (bucket == std::end(client->second)) {
    return nullptr;
  }
  return &bucket->second;
}

account_state_t& engine::get_or_create_account(const client_id_t client_id) {
  auto it = accounts_
                .try_emplace(client_id,
                             account_state_t{.client_id = client_id})
                .first;
  return it->second;
}

}  // namespace ledger::execution
