#pragma once

#include <tessera/common/status.hpp>
#include <tessera/schema/primitives.hpp>
#include <optional>

namespace tessera::custody {

/// Capability the auction engine holds on the custody vault.
///
/// The vault stays the single owner of custody flags and sale proceeds; the
/// auction engine only reaches them through this interface.
class custody_port {
 public:
  virtual ~custody_port() = default;

  virtual const tessera::schema::address_t& owner() const = 0;
  virtual std::optional<tessera::schema::address_t> governance_authority()
      const = 0;
  virtual bool in_custody(tessera::schema::asset_id_t asset_id) const = 0;
  virtual std::optional<tessera::schema::address_t> original_owner(
      tessera::schema::asset_id_t asset_id) const = 0;
  virtual uint32_t royalty_percentage() const = 0;

  /// Listed assets cannot be withdrawn.
  virtual void set_listed(tessera::schema::asset_id_t asset_id,
                          bool listed) = 0;

  /// Move a custodied asset to the auction winner.
  virtual tessera::common::status_t release_to(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::address_t& recipient) = 0;

  /// Add auction proceeds for fraction holders and end custody of the asset.
  virtual tessera::common::status_t record_sale_proceeds(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::amount_t& amount) = 0;
};

}  // namespace tessera::custody
