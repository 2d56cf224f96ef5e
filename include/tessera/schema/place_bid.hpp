#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: place bid.
// Custody workflow: Value-bearing bid; the amount is collected from the
// bidder's balance into escrow.
namespace tessera::schema {

template <uint16_t Version>
struct place_bid;

template <>
struct place_bid<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t amount{};
};

using place_bid_t = place_bid<1>;

}  // namespace tessera::schema
