#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: end auction.
// Custody workflow: Settle an expired auction with at least one bid.
namespace tessera::schema {

template <uint16_t Version>
struct end_auction;

template <>
struct end_auction<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
};

using end_auction_t = end_auction<1>;

}  // namespace tessera::schema
