#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: withdraw pending.
// Custody workflow: Pull the caller's full pending balance out of escrow.
namespace tessera::schema {

template <uint16_t Version>
struct withdraw_pending;

template <>
struct withdraw_pending<1> final {
  uint16_t version{1};
};

using withdraw_pending_t = withdraw_pending<1>;

}  // namespace tessera::schema
