#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: start auction.
// Custody workflow: Owner lists a custodied asset for a time-boxed auction.
namespace tessera::schema {

template <uint16_t Version>
struct start_auction;

template <>
struct start_auction<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t starting_price{};
  duration_milliseconds_t duration{};
};

using start_auction_t = start_auction<1>;

}  // namespace tessera::schema
