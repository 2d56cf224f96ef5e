#include <tessera/payments/pending_payment_ledger.hpp>

#include <spdlog/spdlog.h>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace tessera::payments {

pending_payment_ledger::pending_payment_ledger(
    pending_payments_state_t& state,
    tessera::custody::value_rail& rail,
    tessera::common::busy_set_t& busy,
    tessera::common::event_journal& journal)
    : state_{state}, rail_{rail}, busy_{busy}, journal_{journal} {}

void pending_payment_ledger::credit(const address_t& account,
                                    const amount_t& amount,
                                    const std::string_view reason) {
  if (amount == 0) {
    return;
  }
  state_.owed[account] += amount;
  journal_.emit("pending_credited", {{"account", to_hex(account)},
                                     {"amount", to_string(amount)},
                                     {"reason", std::string{reason}}});
}

status_t pending_payment_ledger::withdraw(const address_t& caller) {
  auto marker =
      tessera::common::busy_marker::try_acquire(busy_, "pending:" + to_hex(caller));
  if (!marker) {
    spdlog::warn("Rejected re-entrant pending withdrawal for {}",
                 to_hex(caller));
    return fail(transaction_error_code::reentrancy_rejected,
                "pending withdrawal already in progress for caller");
  }

  auto entry = state_.owed.find(caller);
  if (entry == std::end(state_.owed) || entry->second == 0) {
    return fail(transaction_error_code::no_funds,
                "no pending balance for caller");
  }
  auto amount = entry->second;
  state_.owed.erase(entry);

  if (auto error = rail_.pay(caller, amount)) {
    state_.owed[caller] = amount;
    return error;
  }
  journal_.emit("pending_withdrawn",
                {{"account", to_hex(caller)}, {"amount", to_string(amount)}});
  return std::nullopt;
}

amount_t pending_payment_ledger::owed(const address_t& account) const {
  auto entry = state_.owed.find(account);
  if (entry == std::end(state_.owed)) {
    return 0;
  }
  return entry->second;
}

amount_t pending_payment_ledger::outstanding() const {
  auto total = amount_t{0};
  for (const auto& [account, amount] : state_.owed) {
    total += amount;
  }
  return total;
}

}  // namespace tessera::payments
