#include <tessera/custody/value_rail.hpp>

#include <algorithm>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace tessera::custody {

value_rail::value_rail(value_rail_state_t& state, receive_hook_t hook)
    : state_{state}, hook_{std::move(hook)} {}

amount_t value_rail::balance_of(const address_t& account) const {
  auto balance = state_.balances.find(account);
  if (balance == std::end(state_.balances)) {
    return 0;
  }
  return balance->second;
}

status_t value_rail::collect(const address_t& from, const amount_t& amount) {
  auto balance = state_.balances.find(from);
  if (balance == std::end(state_.balances) || balance->second < amount) {
    return fail(transaction_error_code::insufficient_funds,
                "account balance does not cover the payment");
  }
  balance->second -= amount;
  state_.escrow += amount;
  return std::nullopt;
}

status_t value_rail::pay(const address_t& to, const amount_t& amount) {
  if (refuses(to)) {
    return fail(transaction_error_code::transfer_failed,
                "recipient refuses value transfers");
  }
  if (state_.escrow < amount) {
    return fail(transaction_error_code::transfer_failed,
                "escrow does not cover the payout");
  }
  state_.escrow -= amount;
  state_.balances[to] += amount;
  if (hook_ && !hook_(to, amount)) {
    state_.balances[to] -= amount;
    state_.escrow += amount;
    return fail(transaction_error_code::transfer_failed,
                "recipient rejected the transfer");
  }
  return std::nullopt;
}

void value_rail::fund(const address_t& account, const amount_t& amount) {
  state_.balances[account] += amount;
}

void value_rail::refuse_value(const address_t& account) {
  if (!refuses(account)) {
    state_.refusing_recipients.push_back(account);
  }
}

bool value_rail::refuses(const address_t& account) const {
  return std::find(std::begin(state_.refusing_recipients),
                   std::end(state_.refusing_recipients),
                   account) != std::end(state_.refusing_recipients);
}

}  // namespace tessera::custody
