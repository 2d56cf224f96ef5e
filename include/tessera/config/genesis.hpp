#pragma once

#include <tessera/schema/auction_parameters.hpp>
#include <tessera/schema/governance_parameters.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/vault_parameters.hpp>
#include <tessera/schema/world_state.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tessera::config {

struct genesis_balance_t final {
  tessera::schema::address_t account{};
  tessera::schema::amount_t amount{};
};

struct genesis_asset_t final {
  tessera::schema::asset_id_t asset_id{};
  tessera::schema::address_t owner{};
};

/// Initial chain configuration. Loaded once when storage holds no state.
struct genesis_t final {
  std::string chain_name{"tessera-local"};
  tessera::schema::address_t owner{};
  tessera::schema::vault_parameters_t vault;
  tessera::schema::auction_parameters_t auction;
  tessera::schema::governance_parameters_t governance;
  std::vector<genesis_balance_t> balances;
  std::vector<genesis_asset_t> assets;
};

/// Parse INI-style genesis settings. On failure `error` holds the reason.
std::optional<genesis_t> parse_genesis(std::istream& input, std::string& error);

std::optional<genesis_t> load_genesis(const std::string& path,
                                      std::string& error);

/// Chain id derived from the chain name.
tessera::schema::hash32_t chain_id(const genesis_t& genesis);

/// Build the height-zero world: balances funded, assets registered, and the
/// vault bound as the fraction ledger's minting authority.
tessera::schema::world_state_t make_world_state(const genesis_t& genesis);

}  // namespace tessera::config
