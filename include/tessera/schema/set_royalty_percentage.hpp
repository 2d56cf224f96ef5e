#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: set royalty percentage.
// Custody workflow: Governance-only update of the depositor royalty.
namespace tessera::schema {

template <uint16_t Version>
struct set_royalty_percentage;

template <>
struct set_royalty_percentage<1> final {
  uint16_t version{1};
  uint32_t percentage{};
};

using set_royalty_percentage_t = set_royalty_percentage<1>;

}  // namespace tessera::schema
