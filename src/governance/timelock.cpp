#include <tessera/custody/system_accounts.hpp>
#include <tessera/governance/timelock.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace tessera::governance {

timelock::timelock(timelock_state_t& state,
                   const duration_milliseconds_t delay,
                   const address_t& administrator,
                   dispatcher_t dispatcher,
                   tessera::common::event_journal& journal)
    : state_{state},
      delay_{delay},
      administrator_{administrator},
      dispatcher_{std::move(dispatcher)},
      journal_{journal} {}

call_id_t timelock::schedule(const proposal_id_t proposal_id,
                             const governance_call_t& call,
                             const timestamp_milliseconds_t now) {
  const auto call_id = state_.next_call_id++;
  state_.calls[call_id] =
      scheduled_call_state_t{.call_id = call_id,
                             .proposal_id = proposal_id,
                             .call = call,
                             .scheduled_at = now,
                             .ready_at = now + delay_,
                             .status = scheduled_call_status_t::pending};
  journal_.emit("call_scheduled",
                {{"call_id", std::to_string(call_id)},
                 {"proposal_id", std::to_string(proposal_id)},
                 {"action", std::string{action_name(call.action)}},
                 {"ready_at", std::to_string(now + delay_)}});
  return call_id;
}

status_t timelock::execute(const call_id_t call_id,
                           const timestamp_milliseconds_t now) {
  auto* entry = static_cast<scheduled_call_state_t*>(nullptr);
  if (auto error = find_pending(call_id, entry)) {
    return error;
  }
  if (now < entry->ready_at) {
    return fail(transaction_error_code::scheduled_call_not_ready,
                fmt::format("call {} is ready at {}", call_id,
                            entry->ready_at));
  }

  // Marked before dispatch so a re-entrant execute sees it finalized.
  entry->status = scheduled_call_status_t::executed;
  const auto call = entry->call;
  if (auto error = dispatcher_(call, tessera::custody::timelock_address())) {
    state_.calls[call_id].status = scheduled_call_status_t::pending;
    return error;
  }

  spdlog::debug("Timelock executed call {} ({})", call_id,
                action_name(call.action));
  journal_.emit("call_executed",
                {{"call_id", std::to_string(call_id)},
                 {"action", std::string{action_name(call.action)}}});
  return std::nullopt;
}

status_t timelock::cancel(const call_id_t call_id, const address_t& caller) {
  if (caller != administrator_) {
    return fail(transaction_error_code::unauthorized,
                "only the timelock administrator may cancel calls");
  }
  auto* entry = static_cast<scheduled_call_state_t*>(nullptr);
  if (auto error = find_pending(call_id, entry)) {
    return error;
  }
  entry->status = scheduled_call_status_t::cancelled;
  journal_.emit("call_cancelled", {{"call_id", std::to_string(call_id)}});
  return std::nullopt;
}

std::optional<scheduled_call_state_t> timelock::call(
    const call_id_t call_id) const {
  auto entry = state_.calls.find(call_id);
  if (entry == std::end(state_.calls)) {
    return std::nullopt;
  }
  return entry->second;
}

status_t timelock::find_pending(const call_id_t call_id,
                                scheduled_call_state_t*& entry) {
  auto it = state_.calls.find(call_id);
  if (it == std::end(state_.calls)) {
    return fail(transaction_error_code::scheduled_call_missing,
                fmt::format("no scheduled call {}", call_id));
  }
  if (it->second.status != scheduled_call_status_t::pending) {
    return fail(transaction_error_code::scheduled_call_finalized,
                fmt::format("call {} is already {}", call_id,
                            to_string(it->second.status)));
  }
  entry = &it->second;
  return std::nullopt;
}

}  // namespace tessera::governance
