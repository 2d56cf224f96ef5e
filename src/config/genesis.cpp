#include <tessera/blake3/hash.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/common/event_journal.hpp>
#include <tessera/config/genesis.hpp>
#include <tessera/custody/asset_registry.hpp>
#include <tessera/custody/fraction_ledger.hpp>
#include <tessera/custody/system_accounts.hpp>
#include <tessera/custody/value_rail.hpp>

#include <boost/program_options.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <charconv>
#include <fstream>
#include <set>
#include <utility>

using namespace tessera::schema;
namespace po = boost::program_options;

namespace {

std::optional<std::pair<std::string_view, std::string_view>> split_pair(
    const std::string_view value) {
  auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  return std::pair{value.substr(0, separator), value.substr(separator + 1)};
}

std::optional<uint64_t> parse_u64(const std::string_view value) {
  auto parsed = uint64_t{};
  auto [end, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || end != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

namespace tessera::config {

std::optional<genesis_t> parse_genesis(std::istream& input,
                                       std::string& error) {
  auto genesis = genesis_t{};
  auto owner_hex = std::string{};
  auto max_extensions = int64_t{-1};
  auto balances = std::vector<std::string>{};
  auto assets = std::vector<std::string>{};

  auto description = po::options_description{"Genesis"};
  description.add_options()(
      "chain.id", po::value<std::string>(&genesis.chain_name)
                      ->default_value(genesis.chain_name))(
      "chain.owner", po::value<std::string>(&owner_hex)->required())(
      "parameters.royalty_percentage",
      po::value<uint32_t>(&genesis.vault.royalty_percentage)
          ->default_value(genesis.vault.royalty_percentage))(
      "parameters.auction_duration_ms",
      po::value<uint64_t>(&genesis.auction.auction_duration)
          ->default_value(genesis.auction.auction_duration))(
      "parameters.anti_snipe_window_ms",
      po::value<uint64_t>(&genesis.auction.anti_snipe_window)
          ->default_value(genesis.auction.anti_snipe_window))(
      "parameters.extension_ms",
      po::value<uint64_t>(&genesis.auction.extension)
          ->default_value(genesis.auction.extension))(
      "parameters.max_extensions",
      po::value<int64_t>(&max_extensions)->default_value(max_extensions))(
      "parameters.proposal_threshold_percentage",
      po::value<uint32_t>(&genesis.governance.proposal_threshold_percentage)
          ->default_value(genesis.governance.proposal_threshold_percentage))(
      "parameters.quorum_percentage",
      po::value<uint32_t>(&genesis.governance.quorum_percentage)
          ->default_value(genesis.governance.quorum_percentage))(
      "parameters.voting_period_ms",
      po::value<uint64_t>(&genesis.governance.voting_period)
          ->default_value(genesis.governance.voting_period))(
      "parameters.timelock_delay_ms",
      po::value<uint64_t>(&genesis.governance.timelock_delay)
          ->default_value(genesis.governance.timelock_delay))(
      "genesis.balance", po::value<std::vector<std::string>>(&balances))(
      "genesis.asset", po::value<std::vector<std::string>>(&assets));

  try {
    auto vm = po::variables_map{};
    po::store(po::parse_config_file(input, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto owner = try_make_hash32(owner_hex);
  if (!owner) {
    error = "chain.owner must be a 32-byte hex address";
    return std::nullopt;
  }
  genesis.owner = *owner;
  const auto percentages = std::array{
      std::pair{"parameters.royalty_percentage",
                genesis.vault.royalty_percentage},
      std::pair{"parameters.proposal_threshold_percentage",
                genesis.governance.proposal_threshold_percentage},
      std::pair{"parameters.quorum_percentage",
                genesis.governance.quorum_percentage}};
  for (const auto& [name, value] : percentages) {
    if (value > 100) {
      error = fmt::format("{} must be within 0..100", name);
      return std::nullopt;
    }
  }
  if (genesis.auction.auction_duration == 0) {
    error = "parameters.auction_duration_ms must be positive";
    return std::nullopt;
  }
  if (max_extensions >= 0) {
    genesis.auction.max_extensions = static_cast<uint32_t>(max_extensions);
  }

  for (const auto& entry : balances) {
    auto parts = split_pair(entry);
    auto account = parts ? try_make_hash32(parts->first) : std::nullopt;
    auto amount = parts ? try_make_amount(parts->second) : std::nullopt;
    if (!account || !amount) {
      error = fmt::format("invalid genesis.balance '{}'", entry);
      return std::nullopt;
    }
    genesis.balances.push_back(
        genesis_balance_t{.account = *account, .amount = *amount});
  }
  auto seen_assets = std::set<asset_id_t>{};
  for (const auto& entry : assets) {
    auto parts = split_pair(entry);
    auto asset_id = parts ? parse_u64(parts->first) : std::nullopt;
    auto asset_owner = parts ? try_make_hash32(parts->second) : std::nullopt;
    if (!asset_id || !asset_owner) {
      error = fmt::format("invalid genesis.asset '{}'", entry);
      return std::nullopt;
    }
    if (!seen_assets.insert(*asset_id).second) {
      error = fmt::format("duplicate genesis.asset id {}", *asset_id);
      return std::nullopt;
    }
    genesis.assets.push_back(
        genesis_asset_t{.asset_id = *asset_id, .owner = *asset_owner});
  }
  return genesis;
}

std::optional<genesis_t> load_genesis(const std::string& path,
                                      std::string& error) {
  auto input = std::ifstream{path};
  if (!input) {
    error = fmt::format("cannot open genesis file '{}'", path);
    return std::nullopt;
  }
  return parse_genesis(input, error);
}

hash32_t chain_id(const genesis_t& genesis) {
  return tessera::blake3::hash(std::string_view{genesis.chain_name});
}

world_state_t make_world_state(const genesis_t& genesis) {
  auto world = world_state_t{};
  world.chain_id = chain_id(genesis);
  world.owner = genesis.owner;
  world.custody.parameters = genesis.vault;
  world.auctions.parameters = genesis.auction;
  world.governance.parameters = genesis.governance;
  world.fractions.administrator = genesis.owner;

  auto journal = tessera::common::event_journal{};
  auto fractions = tessera::custody::fraction_ledger{world.fractions, journal};
  if (auto error = fractions.set_authority(genesis.owner,
                                           tessera::custody::vault_address())) {
    tessera::common::critical("genesis cannot bind fraction authority: {}",
                              error->reason);
  }
  auto rail = tessera::custody::value_rail{world.rail};
  for (const auto& balance : genesis.balances) {
    rail.fund(balance.account, balance.amount);
  }
  auto registry = tessera::custody::asset_registry{world.registry};
  for (const auto& asset : genesis.assets) {
    if (auto error = registry.register_asset(asset.asset_id, asset.owner)) {
      tessera::common::critical("genesis cannot register asset {}: {}",
                                asset.asset_id, error->reason);
    }
  }
  spdlog::info("Genesis '{}': {} funded account(s), {} asset(s)",
               genesis.chain_name, genesis.balances.size(),
               genesis.assets.size());
  return world;
}

}  // namespace tessera::config
