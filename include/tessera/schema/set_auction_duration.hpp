#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set auction duration.
// Custody workflow: Governance-only update of the required auction
// duration.
namespace tessera::schema {

template <uint16_t Version>
struct set_auction_duration;

template <>
struct set_auction_duration<1> final {
  uint16_t version{1};
  duration_milliseconds_t duration{};
};

using set_auction_duration_t = set_auction_duration<1>;

}  // namespace tessera::schema
