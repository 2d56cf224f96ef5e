#include <tessera/custody/fraction_ledger.hpp>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace tessera::custody {

fraction_ledger::fraction_ledger(fraction_ledger_state_t& state,
                                 tessera::common::event_journal& journal)
    : state_{state}, journal_{journal} {}

status_t fraction_ledger::set_authority(const address_t& caller,
                                        const address_t& authority) {
  if (caller != state_.administrator) {
    return fail(transaction_error_code::unauthorized,
                "only the ledger administrator may bind the authority");
  }
  if (state_.authority.has_value()) {
    return fail(transaction_error_code::already_set,
                "ledger authority is already bound");
  }
  state_.authority = authority;
  journal_.emit("ledger_authority_set", {{"authority", to_hex(authority)}});
  return std::nullopt;
}

status_t fraction_ledger::mint(const address_t& caller,
                               const address_t& to,
                               const amount_t& amount) {
  if (auto error = require_authority(caller)) {
    return error;
  }
  state_.balances[to] += amount;
  state_.total_supply += amount;
  return std::nullopt;
}

status_t fraction_ledger::burn_from(const address_t& caller,
                                    const address_t& holder,
                                    const amount_t& amount) {
  if (auto error = require_authority(caller)) {
    return error;
  }
  auto balance = state_.balances.find(holder);
  if (balance == std::end(state_.balances) || balance->second < amount) {
    return fail(transaction_error_code::insufficient_claims,
                "holder balance is below the burn amount");
  }
  balance->second -= amount;
  if (balance->second == 0) {
    state_.balances.erase(balance);
  }
  state_.total_supply -= amount;
  return std::nullopt;
}

status_t fraction_ledger::transfer(const address_t& from,
                                   const address_t& to,
                                   const amount_t& amount) {
  if (amount == 0) {
    return fail(transaction_error_code::invalid_amount,
                "transfer amount must be positive");
  }
  auto balance = state_.balances.find(from);
  if (balance == std::end(state_.balances) || balance->second < amount) {
    return fail(transaction_error_code::insufficient_claims,
                "sender balance is below the transfer amount");
  }
  balance->second -= amount;
  if (balance->second == 0) {
    state_.balances.erase(balance);
  }
  state_.balances[to] += amount;
  journal_.emit("fractions_transferred", {{"from", to_hex(from)},
                                          {"to", to_hex(to)},
                                          {"amount", to_string(amount)}});
  return std::nullopt;
}

amount_t fraction_ledger::balance_of(const address_t& holder) const {
  auto balance = state_.balances.find(holder);
  if (balance == std::end(state_.balances)) {
    return 0;
  }
  return balance->second;
}

amount_t fraction_ledger::total_supply() const {
  return state_.total_supply;
}

status_t fraction_ledger::require_authority(const address_t& caller) const {
  if (!state_.authority.has_value() || *state_.authority != caller) {
    return fail(transaction_error_code::unauthorized,
                "caller is not the ledger authority");
  }
  return std::nullopt;
}

}  // namespace tessera::custody
