#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: transfer fractions.
// Custody workflow: Move fraction claims between holders.
namespace tessera::schema {

template <uint16_t Version>
struct transfer_fractions;

template <>
struct transfer_fractions<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
};

using transfer_fractions_t = transfer_fractions<1>;

}  // namespace tessera::schema
