#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: cancel auction.
// Custody workflow: Governance-only stop of an active auction; the standing
// highest bid is refunded through pending payments.
namespace tessera::schema {

template <uint16_t Version>
struct cancel_auction;

template <>
struct cancel_auction<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
};

using cancel_auction_t = cancel_auction<1>;

}  // namespace tessera::schema
