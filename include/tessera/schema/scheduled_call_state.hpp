#pragma once
#include <tessera/schema/governance_call.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/scheduled_call_status.hpp>

// Schema type: scheduled call state.
// Custody workflow: Timelock queue entry; executes once after `ready_at`
// unless the timelock administrator cancels it first.
namespace tessera::schema {

template <uint16_t Version>
struct scheduled_call_state;

template <>
struct scheduled_call_state<1> final {
  uint16_t version{1};
  call_id_t call_id{};
  proposal_id_t proposal_id{};
  governance_call_t call;
  timestamp_milliseconds_t scheduled_at{};
  timestamp_milliseconds_t ready_at{};
  scheduled_call_status_t status{scheduled_call_status_t::pending};
};

using scheduled_call_state_t = scheduled_call_state<1>;

}  // namespace tessera::schema
