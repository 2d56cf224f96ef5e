#include <gtest/gtest.h>
#include <tessera/blake3/hash.hpp>
#include <tessera/config/genesis.hpp>
#include <tessera/custody/system_accounts.hpp>
#include <tessera/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <string>

using tessera::schema::amount_t;
using tessera::schema::to_hex;
using tessera::testing::make_hash;

namespace {

std::optional<tessera::config::genesis_t> parse(const std::string& text,
                                                std::string& error) {
  auto input = std::istringstream{text};
  return tessera::config::parse_genesis(input, error);
}

std::string owner_line() {
  return "owner = " + to_hex(make_hash(1)) + "\n";
}

}  // namespace

TEST(genesis, parses_parameters_balances_and_assets) {
  const auto text = "[chain]\n"
                    "id = tessera-test\n" +
                    owner_line() +
                    "[parameters]\n"
                    "royalty_percentage = 7\n"
                    "auction_duration_ms = 60000\n"
                    "max_extensions = 3\n"
                    "quorum_percentage = 30\n"
                    "[genesis]\n"
                    "balance = " +
                    to_hex(make_hash(2)) +
                    ":1000000\n"
                    "balance = " +
                    to_hex(make_hash(3)) +
                    ":5\n"
                    "asset = 7:" +
                    to_hex(make_hash(2)) + "\n";
  auto error = std::string{};
  auto genesis = parse(text, error);
  ASSERT_TRUE(genesis.has_value()) << error;

  EXPECT_EQ(genesis->chain_name, "tessera-test");
  EXPECT_EQ(genesis->owner, make_hash(1));
  EXPECT_EQ(genesis->vault.royalty_percentage, 7u);
  EXPECT_EQ(genesis->auction.auction_duration, 60'000u);
  EXPECT_EQ(genesis->auction.max_extensions, 3u);
  EXPECT_EQ(genesis->governance.quorum_percentage, 30u);
  EXPECT_EQ(genesis->governance.proposal_threshold_percentage, 5u);
  ASSERT_EQ(genesis->balances.size(), 2u);
  EXPECT_EQ(genesis->balances[0].amount, amount_t{1'000'000});
  ASSERT_EQ(genesis->assets.size(), 1u);
  EXPECT_EQ(genesis->assets[0].asset_id, 7u);
  EXPECT_EQ(genesis->assets[0].owner, make_hash(2));
}

TEST(genesis, defaults_leave_extensions_unbounded) {
  auto error = std::string{};
  auto genesis = parse("[chain]\n" + owner_line(), error);
  ASSERT_TRUE(genesis.has_value()) << error;
  EXPECT_EQ(genesis->chain_name, "tessera-local");
  EXPECT_FALSE(genesis->auction.max_extensions.has_value());
  EXPECT_EQ(genesis->vault.royalty_percentage,
            tessera::schema::kDefaultRoyaltyPercentage);
}

TEST(genesis, rejects_missing_or_malformed_owner) {
  auto error = std::string{};
  EXPECT_FALSE(parse("[chain]\nid = x\n", error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(parse("[chain]\nowner = zz\n", error).has_value());
  EXPECT_EQ(error, "chain.owner must be a 32-byte hex address");
}

TEST(genesis, rejects_out_of_range_parameters) {
  auto error = std::string{};
  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[parameters]\nroyalty_percentage = 101\n",
                     error)
                   .has_value());
  EXPECT_EQ(error, "parameters.royalty_percentage must be within 0..100");

  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[parameters]\nquorum_percentage = 250\n",
                     error)
                   .has_value());
  EXPECT_EQ(error, "parameters.quorum_percentage must be within 0..100");

  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[parameters]\nproposal_threshold_percentage = 400\n",
                     error)
                   .has_value());
  EXPECT_EQ(error,
            "parameters.proposal_threshold_percentage must be within 0..100");

  error.clear();
  EXPECT_TRUE(parse("[chain]\n" + owner_line() +
                        "[parameters]\nquorum_percentage = 100\n"
                        "proposal_threshold_percentage = 0\n",
                    error)
                  .has_value())
      << error;

  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[parameters]\nauction_duration_ms = 0\n",
                     error)
                   .has_value());
  EXPECT_EQ(error, "parameters.auction_duration_ms must be positive");
}

TEST(genesis, rejects_malformed_entries) {
  auto error = std::string{};
  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[genesis]\nbalance = 1000\n",
                     error)
                   .has_value());
  EXPECT_EQ(error, "invalid genesis.balance '1000'");

  EXPECT_FALSE(parse("[chain]\n" + owner_line() +
                         "[genesis]\nasset = seven:" + to_hex(make_hash(2)) +
                         "\n",
                     error)
                   .has_value());
  EXPECT_NE(error.find("invalid genesis.asset"), std::string::npos);

  const auto asset_line = "asset = 7:" + to_hex(make_hash(2)) + "\n";
  EXPECT_FALSE(parse("[chain]\n" + owner_line() + "[genesis]\n" + asset_line +
                         asset_line,
                     error)
                   .has_value());
  EXPECT_EQ(error, "duplicate genesis.asset id 7");

  EXPECT_FALSE(parse("[chain]\n" + owner_line() + "[bogus]\nkey = 1\n", error)
                   .has_value());
}

TEST(genesis, load_reports_missing_file) {
  auto error = std::string{};
  auto path = tessera::testing::make_db_path("tessera_missing_genesis");
  EXPECT_FALSE(tessera::config::load_genesis(path, error).has_value());
  EXPECT_NE(error.find("cannot open genesis file"), std::string::npos);
}

TEST(genesis, load_reads_file_from_disk) {
  auto path = tessera::testing::make_db_path("tessera_genesis") + ".ini";
  {
    auto out = std::ofstream{path};
    out << "[chain]\n" << owner_line();
  }
  auto error = std::string{};
  auto genesis = tessera::config::load_genesis(path, error);
  tessera::testing::remove_path(path);
  ASSERT_TRUE(genesis.has_value()) << error;
  EXPECT_EQ(genesis->owner, make_hash(1));
}

TEST(genesis, world_state_binds_vault_and_funds_accounts) {
  auto genesis = tessera::config::genesis_t{};
  genesis.owner = make_hash(1);
  genesis.balances.push_back({.account = make_hash(2), .amount = 500});
  genesis.assets.push_back({.asset_id = 7, .owner = make_hash(2)});

  auto world = tessera::config::make_world_state(genesis);
  EXPECT_EQ(world.chain_id, tessera::blake3::hash(std::string_view{
                                "tessera-local"}));
  EXPECT_EQ(world.chain_id, tessera::config::chain_id(genesis));
  EXPECT_EQ(world.owner, make_hash(1));
  EXPECT_EQ(world.fractions.administrator, make_hash(1));
  EXPECT_EQ(world.fractions.authority, tessera::custody::vault_address());
  EXPECT_EQ(world.rail.balances.at(make_hash(2)), amount_t{500});
  EXPECT_EQ(world.registry.owners.at(7), make_hash(2));
  EXPECT_FALSE(world.custody.governance_authority.has_value());
}
