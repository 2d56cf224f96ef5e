#pragma once

#include <tessera/common/event_journal.hpp>
#include <tessera/common/status.hpp>
#include <tessera/custody/claim_ledger.hpp>
#include <tessera/schema/world_state.hpp>

namespace tessera::custody {

/// Fungible fraction-claim ledger.
///
/// The administrator binds the minting authority exactly once; after that
/// only the authority may mint or burn. Holders move claims with
/// `transfer`.
class fraction_ledger final : public claim_ledger {
 public:
  fraction_ledger(tessera::schema::fraction_ledger_state_t& state,
                  tessera::common::event_journal& journal);

  tessera::common::status_t set_authority(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& authority);

  tessera::common::status_t mint(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& to,
      const tessera::schema::amount_t& amount) override;

  tessera::common::status_t burn_from(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& holder,
      const tessera::schema::amount_t& amount) override;

  tessera::common::status_t transfer(
      const tessera::schema::address_t& from,
      const tessera::schema::address_t& to,
      const tessera::schema::amount_t& amount);

  tessera::schema::amount_t balance_of(
      const tessera::schema::address_t& holder) const override;

  tessera::schema::amount_t total_supply() const override;

  const std::optional<tessera::schema::address_t>& authority() const {
    return state_.authority;
  }

 private:
  tessera::common::status_t require_authority(
      const tessera::schema::address_t& caller) const;

  tessera::schema::fraction_ledger_state_t& state_;
  tessera::common::event_journal& journal_;
};

}  // namespace tessera::custody
