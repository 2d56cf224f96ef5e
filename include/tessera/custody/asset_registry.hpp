#pragma once

#include <tessera/common/status.hpp>
#include <tessera/schema/world_state.hpp>
#include <optional>

namespace tessera::custody {

/// Ownership registry for unique, non-divisible assets.
class asset_registry final {
 public:
  explicit asset_registry(tessera::schema::asset_registry_state_t& state);

  std::optional<tessera::schema::address_t> owner_of(
      tessera::schema::asset_id_t asset_id) const;

  /// Fails with `transfer_failed` unless `from` currently owns the asset.
  tessera::common::status_t transfer(const tessera::schema::address_t& from,
                                     const tessera::schema::address_t& to,
                                     tessera::schema::asset_id_t asset_id);

  /// Genesis-time registration of a newly minted asset.
  tessera::common::status_t register_asset(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::address_t& owner);

 private:
  tessera::schema::asset_registry_state_t& state_;
};

}  // namespace tessera::custody
