#pragma once

#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/schema/world_state.hpp>
#include <functional>
#include <optional>

namespace tessera::governance {

/// Applies a governance call to its target component with `caller` as the
/// invoking account.
using dispatcher_t =
    std::function<tessera::common::status_t(
        const tessera::schema::governance_call_t& call,
        const tessera::schema::address_t& caller)>;

/// Delay queue between a passed proposal and the call it authorizes.
class timelock final {
 public:
  timelock(tessera::schema::timelock_state_t& state,
           tessera::schema::duration_milliseconds_t delay,
           const tessera::schema::address_t& administrator,
           dispatcher_t dispatcher,
           tessera::common::event_journal& journal);

  tessera::schema::call_id_t schedule(
      tessera::schema::proposal_id_t proposal_id,
      const tessera::schema::governance_call_t& call,
      tessera::schema::timestamp_milliseconds_t now);

  /// Any caller may trigger a ready call; it runs as the timelock account.
  tessera::common::status_t execute(
      tessera::schema::call_id_t call_id,
      tessera::schema::timestamp_milliseconds_t now);

  tessera::common::status_t cancel(tessera::schema::call_id_t call_id,
                                   const tessera::schema::address_t& caller);

  std::optional<tessera::schema::scheduled_call_state_t> call(
      tessera::schema::call_id_t call_id) const;

 private:
  tessera::common::status_t find_pending(
      tessera::schema::call_id_t call_id,
      tessera::schema::scheduled_call_state_t*& entry);

  tessera::schema::timelock_state_t& state_;
  tessera::schema::duration_milliseconds_t delay_;
  tessera::schema::address_t administrator_;
  dispatcher_t dispatcher_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::governance
