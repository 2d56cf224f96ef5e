#pragma once
#include <tessera/schema/asset_record.hpp>
#include <tessera/schema/auction_parameters.hpp>
#include <tessera/schema/auction_state.hpp>
#include <tessera/schema/governance_parameters.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/proposal_state.hpp>
#include <tessera/schema/scheduled_call_state.hpp>
#include <tessera/schema/vault_parameters.hpp>
#include <map>
#include <optional>
#include <vector>

// Schema type: world state.
// Custody workflow: Every piece of mutable state, grouped by the component
// that owns it. Transactions run against a scratch copy and replace the live
// value only on success.
namespace tessera::schema {

struct custody_state_t final {
  std::map<asset_id_t, asset_record_t> assets;
  std::optional<address_t> governance_authority;
  vault_parameters_t parameters;
};

struct auction_book_t final {
  std::map<asset_id_t, auction_state_t> auctions;
  auction_parameters_t parameters;
};

struct pending_payments_state_t final {
  std::map<address_t, amount_t> owed;
};

struct governance_state_t final {
  std::map<proposal_id_t, proposal_state_t> proposals;
  proposal_id_t next_proposal_id{1};
  governance_parameters_t parameters;
};

struct timelock_state_t final {
  std::map<call_id_t, scheduled_call_state_t> calls;
  call_id_t next_call_id{1};
};

struct fraction_ledger_state_t final {
  std::map<address_t, amount_t> balances;
  amount_t total_supply{};
  address_t administrator{};
  std::optional<address_t> authority;
};

struct asset_registry_state_t final {
  std::map<asset_id_t, address_t> owners;
};

struct value_rail_state_t final {
  std::map<address_t, amount_t> balances;
  amount_t escrow{};
  std::vector<address_t> refusing_recipients;
};

template <uint16_t Version>
struct world_state;

template <>
struct world_state<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  address_t owner{};
  std::map<address_t, uint64_t> nonces;
  custody_state_t custody;
  auction_book_t auctions;
  pending_payments_state_t pending;
  governance_state_t governance;
  timelock_state_t timelock;
  fraction_ledger_state_t fractions;
  asset_registry_state_t registry;
  value_rail_state_t rail;
};

using world_state_t = world_state<1>;

}  // namespace tessera::schema
