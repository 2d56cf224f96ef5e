#pragma once

#include <tessera/common/status.hpp>
#include <tessera/schema/primitives.hpp>

namespace tessera::custody {

/// Mint/burn/balance contract the vault consumes from the fraction ledger.
///
/// `caller` is the account invoking the ledger; only the ledger's authority
/// may mint or burn.
class claim_ledger {
 public:
  virtual ~claim_ledger() = default;

  virtual tessera::common::status_t mint(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& to,
      const tessera::schema::amount_t& amount) = 0;

  virtual tessera::common::status_t burn_from(
      const tessera::schema::address_t& caller,
      const tessera::schema::address_t& holder,
      const tessera::schema::amount_t& amount) = 0;

  virtual tessera::schema::amount_t balance_of(
      const tessera::schema::address_t& holder) const = 0;

  virtual tessera::schema::amount_t total_supply() const = 0;
};

}  // namespace tessera::custody
