#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: redeem.
// Custody workflow: Burn claims against an asset's recorded sale proceeds
// for a pro-rata payout.
namespace tessera::schema {

template <uint16_t Version>
struct redeem;

template <>
struct redeem<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t fraction_amount{};
};

using redeem_t = redeem<1>;

}  // namespace tessera::schema
