#pragma once

#include <tessera/common/busy_marker.hpp>
#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/custody_port.hpp>
#include <tessera/custody/value_rail.hpp>
#include <tessera/payments/pending_payment_ledger.hpp>
#include <tessera/schema/world_state.hpp>
#include <optional>
#include <string_view>

namespace tessera::auction {

/// Per-asset English auction over custodied assets.
///
/// State machine: inactive -> active (start) -> inactive (end or cancel).
/// Bids must strictly exceed the standing bid; the displaced bid is credited
/// to pending payments. A bid landing inside the anti-snipe window pushes the
/// end time out by one extension.
class auction_engine final {
 public:
  auction_engine(tessera::schema::auction_book_t& book,
                 tessera::custody::custody_port& custody,
                 tessera::payments::pending_payment_ledger& pending,
                 tessera::custody::value_rail& rail,
                 tessera::common::busy_set_t& busy,
                 tessera::common::event_journal& journal);

  /// Owner-only; `duration` must equal the configured auction duration.
  tessera::common::status_t start(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::amount_t& starting_price,
      tessera::schema::duration_milliseconds_t duration,
      const tessera::schema::address_t& caller,
      tessera::schema::timestamp_milliseconds_t now);

  tessera::common::status_t bid(tessera::schema::asset_id_t asset_id,
                                const tessera::schema::amount_t& payment,
                                const tessera::schema::address_t& caller,
                                tessera::schema::timestamp_milliseconds_t now);

  tessera::common::status_t end(tessera::schema::asset_id_t asset_id,
                                const tessera::schema::address_t& caller,
                                tessera::schema::timestamp_milliseconds_t now);

  /// Governance-only. Refunds the standing bid before clearing it.
  tessera::common::status_t cancel(tessera::schema::asset_id_t asset_id,
                                   const tessera::schema::address_t& caller);

  tessera::common::status_t set_auction_duration(
      const tessera::schema::address_t& caller,
      tessera::schema::duration_milliseconds_t duration);

  std::optional<tessera::schema::auction_state_t> auction(
      tessera::schema::asset_id_t asset_id) const;
  const tessera::schema::auction_parameters_t& parameters() const {
    return book_.parameters;
  }

 private:
  tessera::common::status_t require_governance(
      const tessera::schema::address_t& caller,
      std::string_view what) const;

  tessera::schema::auction_book_t& book_;
  tessera::custody::custody_port& custody_;
  tessera::payments::pending_payment_ledger& pending_;
  tessera::custody::value_rail& rail_;
  tessera::common::busy_set_t& busy_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::auction
