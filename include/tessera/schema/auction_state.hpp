#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>

// Schema type: auction state.
// Custody workflow: Per-asset auction record; one active auction per asset.
namespace tessera::schema {

template <uint16_t Version>
struct auction_state;

template <>
struct auction_state<1> final {
  uint16_t version{1};
  bool is_active{};
  timestamp_milliseconds_t started_at{};
  timestamp_milliseconds_t end_time{};
  amount_t starting_price{};
  amount_t highest_bid{};
  std::optional<address_t> highest_bidder;
  uint32_t total_bids{};
  uint32_t extensions{};
};

using auction_state_t = auction_state<1>;

}  // namespace tessera::schema
