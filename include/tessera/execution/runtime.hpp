#pragma once

#include <tessera/auction/auction_engine.hpp>
#include <tessera/common/busy_marker.hpp>
#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/asset_registry.hpp>
#include <tessera/custody/custody_vault.hpp>
#include <tessera/custody/fraction_ledger.hpp>
#include <tessera/custody/value_rail.hpp>
#include <tessera/governance/governance_controller.hpp>
#include <tessera/governance/timelock.hpp>
#include <tessera/payments/pending_payment_ledger.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/schema/world_state.hpp>
#include <string_view>
#include <vector>

namespace tessera::execution {

/// All components wired over one world state at one instant.
///
/// A runtime lives for a single transaction. Components hold references into
/// `world`, so the caller decides atomicity by choosing what `world` is.
class runtime final {
 public:
  runtime(tessera::schema::world_state_t& world,
          tessera::schema::timestamp_milliseconds_t now,
          tessera::custody::receive_hook_t receive_hook = {});

  runtime(const runtime&) = delete;
  runtime& operator=(const runtime&) = delete;

  /// Run one payload as `signer`. On failure the components have undone
  /// their own effects but events already journaled stay; callers discard
  /// them together with the state.
  tessera::common::status_t apply(
      const tessera::schema::address_t& signer,
      const tessera::schema::transaction_payload_t& payload);

  std::vector<tessera::schema::transaction_event_t> take_events() {
    return journal_.take();
  }

  tessera::custody::fraction_ledger& fractions() { return fractions_; }
  tessera::custody::asset_registry& registry() { return registry_; }
  tessera::custody::value_rail& rail() { return rail_; }
  tessera::payments::pending_payment_ledger& pending() { return pending_; }
  tessera::custody::custody_vault& vault() { return vault_; }
  tessera::auction::auction_engine& auctions() { return auctions_; }
  tessera::governance::timelock& delay_queue() { return timelock_; }
  tessera::governance::governance_controller& governance() {
    return governance_;
  }

 private:
  tessera::common::status_t dispatch(
      const tessera::schema::governance_call_t& call,
      const tessera::schema::address_t& caller);

  tessera::schema::timestamp_milliseconds_t now_;
  tessera::common::busy_set_t busy_;
  tessera::common::event_journal journal_;
  tessera::custody::fraction_ledger fractions_;
  tessera::custody::asset_registry registry_;
  tessera::custody::value_rail rail_;
  tessera::payments::pending_payment_ledger pending_;
  tessera::custody::custody_vault vault_;
  tessera::auction::auction_engine auctions_;
  tessera::governance::timelock timelock_;
  tessera::governance::governance_controller governance_;
};

/// Result codespace of the component that owns `payload`.
std::string_view codespace(const tessera::schema::transaction_payload_t& payload);

}  // namespace tessera::execution
