#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set authority.
// Custody workflow: One-time binding of the governance authority that may
// cancel auctions and update parameters.
namespace tessera::schema {

template <uint16_t Version>
struct set_authority;

template <>
struct set_authority<1> final {
  uint16_t version{1};
  address_t governance_authority{};
};

using set_authority_t = set_authority<1>;

}  // namespace tessera::schema
