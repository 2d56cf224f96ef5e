#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: withdraw asset.
// Custody workflow: Return a locked asset to a caller holding a full
// asset's worth of claims; the claims are burned.
namespace tessera::schema {

template <uint16_t Version>
struct withdraw_asset;

template <>
struct withdraw_asset<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
};

using withdraw_asset_t = withdraw_asset<1>;

}  // namespace tessera::schema
