#pragma once

#include <tessera/common/busy_marker.hpp>
#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/asset_registry.hpp>
#include <tessera/custody/claim_ledger.hpp>
#include <tessera/custody/custody_port.hpp>
#include <tessera/custody/value_rail.hpp>
#include <tessera/schema/world_state.hpp>
#include <optional>
#include <vector>

namespace tessera::custody {

/// Custody of unique assets against fungible fraction claims.
///
/// Each locked asset backs exactly `kFractionsPerAsset` claims minted to the
/// depositor. Claims come back either by withdrawing the asset (burning a
/// full asset's worth) or by redeeming against sale proceeds recorded when
/// the asset is auctioned.
class custody_vault final : public custody_port {
 public:
  custody_vault(tessera::schema::custody_state_t& state,
                const tessera::schema::address_t& owner,
                claim_ledger& claims,
                asset_registry& registry,
                value_rail& rail,
                tessera::common::busy_set_t& busy,
                tessera::common::event_journal& journal);

  /// Lock every listed asset or none of them.
  tessera::common::status_t deposit(
      const std::vector<tessera::schema::asset_id_t>& asset_ids,
      const tessera::schema::address_t& caller);

  tessera::common::status_t withdraw(tessera::schema::asset_id_t asset_id,
                                     const tessera::schema::address_t& caller);

  /// Pay `proceeds * fraction_amount / total_supply` and burn the claims.
  /// The division truncates; the remainder stays in escrow.
  tessera::common::status_t redeem(tessera::schema::asset_id_t asset_id,
                                   const tessera::schema::amount_t& fraction_amount,
                                   const tessera::schema::address_t& caller);

  /// One-time, owner-only. There is no way to re-point the authority later.
  tessera::common::status_t set_authority(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& governance_authority);

  tessera::common::status_t set_royalty_percentage(
      const tessera::schema::address_t& caller,
      uint32_t percentage);

  std::optional<tessera::schema::asset_record_t> record(
      tessera::schema::asset_id_t asset_id) const;
  const tessera::schema::vault_parameters_t& parameters() const {
    return state_.parameters;
  }

  const tessera::schema::address_t& owner() const override;
  std::optional<tessera::schema::address_t> governance_authority()
      const override;
  bool in_custody(tessera::schema::asset_id_t asset_id) const override;
  std::optional<tessera::schema::address_t> original_owner(
      tessera::schema::asset_id_t asset_id) const override;
  uint32_t royalty_percentage() const override;
  void set_listed(tessera::schema::asset_id_t asset_id, bool listed) override;
  tessera::common::status_t release_to(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::address_t& recipient) override;
  tessera::common::status_t record_sale_proceeds(
      tessera::schema::asset_id_t asset_id,
      const tessera::schema::amount_t& amount) override;

 private:
  /// Take custody of one asset and mint its claims; undone on any failure.
  tessera::common::status_t lock_one(tessera::schema::asset_id_t asset_id,
                                     const tessera::schema::address_t& caller);
  void unlock_one(tessera::schema::asset_id_t asset_id,
                  const tessera::schema::address_t& caller,
                  const std::optional<tessera::schema::asset_record_t>& previous);

  tessera::schema::custody_state_t& state_;
  tessera::schema::address_t owner_;
  claim_ledger& claims_;
  asset_registry& registry_;
  value_rail& rail_;
  tessera::common::busy_set_t& busy_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::custody
