#pragma once

#include <tessera/common/busy_marker.hpp>
#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/value_rail.hpp>
#include <tessera/schema/world_state.hpp>

namespace tessera::payments {

/// Pull-payment escrow for refunds, royalties, and outbid bids.
///
/// Credits are only made by other components. Only the owed account can
/// withdraw, and a withdrawal zeroes the balance before value leaves escrow.
class pending_payment_ledger final {
 public:
  pending_payment_ledger(tessera::schema::pending_payments_state_t& state,
                         tessera::custody::value_rail& rail,
                         tessera::common::busy_set_t& busy,
                         tessera::common::event_journal& journal);

  void credit(const tessera::schema::address_t& account,
              const tessera::schema::amount_t& amount,
              std::string_view reason);

  tessera::common::status_t withdraw(const tessera::schema::address_t& caller);

  tessera::schema::amount_t owed(
      const tessera::schema::address_t& account) const;

  /// Sum of all credited-but-unwithdrawn balances.
  tessera::schema::amount_t outstanding() const;

 private:
  tessera::schema::pending_payments_state_t& state_;
  tessera::custody::value_rail& rail_;
  tessera::common::busy_set_t& busy_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::payments
