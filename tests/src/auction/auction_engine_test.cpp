#include <gtest/gtest.h>
#include <tessera/testing/world_fixture.hpp>

using namespace tessera::schema;
using tessera::testing::kGenesisTime;
using tessera::testing::kStartingBalance;
using tessera::testing::world_fixture;

namespace {

transaction_error_code code_of(const tessera::common::status_t& status) {
  return status.has_value() ? status->code : transaction_error_code{};
}

/// Asset 7 deposited by alice and listed by the owner at `kGenesisTime`.
class listed_asset {
 public:
  explicit listed_asset(const amount_t& starting_price = 100) {
    EXPECT_FALSE(fixture.apply(fixture.who.alice, deposit_t{.asset_ids = {7}}));
    EXPECT_FALSE(fixture.apply(
        fixture.who.owner, start_auction_t{.asset_id = 7,
                                           .starting_price = starting_price,
                                           .duration = duration()}));
  }

  duration_milliseconds_t duration() {
    return fixture.world().auctions.parameters.auction_duration;
  }

  timestamp_milliseconds_t end_time() {
    return fixture.world().auctions.auctions.at(7).end_time;
  }

  world_fixture fixture;
};

}  // namespace

TEST(auction_engine, start_lists_asset_for_configured_duration) {
  auto listed = listed_asset{};
  auto view = listed.fixture.view();
  auto auction = view.auctions().auction(7);
  ASSERT_TRUE(auction.has_value());
  EXPECT_TRUE(auction->is_active);
  EXPECT_EQ(auction->highest_bid, amount_t{100});
  EXPECT_FALSE(auction->highest_bidder.has_value());
  EXPECT_EQ(auction->end_time, kGenesisTime + kDayMilliseconds);
  EXPECT_TRUE(view.vault().record(7)->listed);
}

TEST(auction_engine, start_enforces_owner_duration_custody_and_single_auction) {
  auto fixture = world_fixture{};
  const auto duration = fixture.world().auctions.parameters.auction_duration;
  ASSERT_FALSE(fixture.apply(fixture.who.alice, deposit_t{.asset_ids = {7}}));

  EXPECT_EQ(code_of(fixture.apply(fixture.who.alice,
                                  start_auction_t{.asset_id = 7,
                                                  .starting_price = 100,
                                                  .duration = duration})),
            transaction_error_code::unauthorized);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  start_auction_t{.asset_id = 7,
                                                  .starting_price = 100,
                                                  .duration = duration - 1})),
            transaction_error_code::duration_mismatch);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  start_auction_t{.asset_id = 8,
                                                  .starting_price = 100,
                                                  .duration = duration})),
            transaction_error_code::not_in_custody);
  ASSERT_FALSE(fixture.apply(fixture.who.owner,
                             start_auction_t{.asset_id = 7,
                                             .starting_price = 100,
                                             .duration = duration}));
  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  start_auction_t{.asset_id = 7,
                                                  .starting_price = 100,
                                                  .duration = duration})),
            transaction_error_code::auction_active);
}

TEST(auction_engine, sale_settles_asset_royalty_and_refunds) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  const auto& who = fixture.who;

  ASSERT_FALSE(fixture.apply(who.bob, place_bid_t{.asset_id = 7, .amount = 150},
                             kGenesisTime + 1'000));
  ASSERT_FALSE(fixture.apply(who.carol,
                             place_bid_t{.asset_id = 7, .amount = 200},
                             kGenesisTime + 2'000));
  EXPECT_EQ(fixture.view().pending().owed(who.bob), amount_t{150});

  ASSERT_FALSE(fixture.apply(who.dave, end_auction_t{.asset_id = 7},
                             listed.end_time()));
  auto view = fixture.view();
  EXPECT_EQ(view.registry().owner_of(7), who.carol);
  EXPECT_FALSE(view.auctions().auction(7)->is_active);
  EXPECT_EQ(view.vault().record(7)->sale_proceeds, amount_t{200});
  EXPECT_FALSE(view.vault().in_custody(7));
  EXPECT_EQ(view.pending().owed(who.alice), amount_t{10});
  EXPECT_EQ(view.rail().balance_of(who.carol),
            amount_t{kStartingBalance} - 200);

  ASSERT_FALSE(fixture.apply(who.bob, withdraw_pending_t{}));
  EXPECT_EQ(fixture.view().rail().balance_of(who.bob),
            amount_t{kStartingBalance});
  EXPECT_EQ(code_of(fixture.apply(who.bob, withdraw_pending_t{})),
            transaction_error_code::no_funds);

  // Redeeming half the claims pays half the proceeds.
  ASSERT_FALSE(fixture.apply(who.alice,
                             redeem_t{.asset_id = 7, .fraction_amount = 500}));
  auto redeemed = fixture.view();
  EXPECT_EQ(redeemed.rail().balance_of(who.alice),
            amount_t{kStartingBalance} + 100);
  EXPECT_EQ(redeemed.vault().record(7)->sale_proceeds, amount_t{100});
}

TEST(auction_engine, bids_must_strictly_exceed_standing_bid) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  EXPECT_EQ(code_of(fixture.apply(fixture.who.bob,
                                  place_bid_t{.asset_id = 7, .amount = 100})),
            transaction_error_code::bid_too_low);
  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 101}));
  EXPECT_EQ(code_of(fixture.apply(fixture.who.carol,
                                  place_bid_t{.asset_id = 7, .amount = 101})),
            transaction_error_code::bid_too_low);
  EXPECT_EQ(fixture.view().auctions().auction(7)->total_bids, 1u);
}

TEST(auction_engine, bid_requires_active_unexpired_auction_and_funds) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  EXPECT_EQ(code_of(fixture.apply(fixture.who.bob,
                                  place_bid_t{.asset_id = 8, .amount = 500})),
            transaction_error_code::auction_not_active);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.bob,
                                  place_bid_t{.asset_id = 7, .amount = 500},
                                  listed.end_time())),
            transaction_error_code::auction_expired);
  EXPECT_EQ(code_of(fixture.apply(
                fixture.who.bob,
                place_bid_t{.asset_id = 7,
                            .amount = amount_t{kStartingBalance} + 1})),
            transaction_error_code::insufficient_funds);
  EXPECT_EQ(fixture.view().rail().escrow(), amount_t{0});
}

TEST(auction_engine, late_bid_extends_end_time) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  const auto original_end = listed.end_time();
  const auto window = fixture.world().auctions.parameters.anti_snipe_window;
  const auto extension = fixture.world().auctions.parameters.extension;

  // Outside the window: no extension.
  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 150},
                             original_end - window - 1));
  EXPECT_EQ(listed.end_time(), original_end);

  ASSERT_FALSE(fixture.apply(fixture.who.carol,
                             place_bid_t{.asset_id = 7, .amount = 200},
                             original_end - 5 * kMinuteMilliseconds));
  EXPECT_EQ(listed.end_time(), original_end + extension);
  EXPECT_EQ(fixture.view().auctions().auction(7)->extensions, 1u);
  // Outbid credit, the bid itself, then the extension.
  ASSERT_EQ(fixture.last_events().size(), 3u);
  EXPECT_EQ(fixture.last_events()[0].type, "pending_credited");
  EXPECT_EQ(fixture.last_events()[2].type, "auction_extended");

  // The original end no longer closes the auction.
  EXPECT_EQ(code_of(fixture.apply(fixture.who.dave,
                                  end_auction_t{.asset_id = 7},
                                  original_end)),
            transaction_error_code::auction_not_ended);
  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 250},
                             original_end));
}

TEST(auction_engine, bid_at_window_start_extends_end_time) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  const auto original_end = listed.end_time();
  const auto window = fixture.world().auctions.parameters.anti_snipe_window;
  const auto extension = fixture.world().auctions.parameters.extension;

  // Exactly one window before the end counts as late.
  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 150},
                             original_end - window));
  EXPECT_EQ(listed.end_time(), original_end + extension);
  EXPECT_EQ(fixture.view().auctions().auction(7)->extensions, 1u);
  EXPECT_EQ(fixture.last_events().back().type, "auction_extended");
}

TEST(auction_engine, extensions_stop_at_configured_cap) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  fixture.world().auctions.parameters.max_extensions = 1;
  const auto original_end = listed.end_time();
  const auto extension = fixture.world().auctions.parameters.extension;

  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 150},
                             original_end - 1));
  ASSERT_FALSE(fixture.apply(fixture.who.carol,
                             place_bid_t{.asset_id = 7, .amount = 200},
                             original_end + extension - 1));
  EXPECT_EQ(listed.end_time(), original_end + extension);
  EXPECT_EQ(fixture.view().auctions().auction(7)->extensions, 1u);
}

TEST(auction_engine, end_requires_expiry_and_a_bid) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  EXPECT_EQ(code_of(fixture.apply(fixture.who.dave,
                                  end_auction_t{.asset_id = 7},
                                  listed.end_time() - 1)),
            transaction_error_code::auction_not_ended);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.dave,
                                  end_auction_t{.asset_id = 7},
                                  listed.end_time())),
            transaction_error_code::no_bids);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.dave,
                                  end_auction_t{.asset_id = 8},
                                  listed.end_time())),
            transaction_error_code::auction_not_active);
  EXPECT_TRUE(fixture.view().auctions().auction(7)->is_active);
}

TEST(auction_engine, governance_cancel_refunds_standing_bid) {
  auto listed = listed_asset{};
  auto& fixture = listed.fixture;
  ASSERT_FALSE(fixture.apply(fixture.who.owner,
                             set_authority_t{.governance_authority =
                                                 fixture.who.carol}));
  ASSERT_FALSE(fixture.apply(fixture.who.bob,
                             place_bid_t{.asset_id = 7, .amount = 150}));

  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  cancel_auction_t{.asset_id = 7})),
            transaction_error_code::unauthorized);
  ASSERT_FALSE(fixture.apply(fixture.who.carol,
                             cancel_auction_t{.asset_id = 7}));

  auto view = fixture.view();
  auto auction = view.auctions().auction(7);
  EXPECT_FALSE(auction->is_active);
  EXPECT_EQ(auction->highest_bid, amount_t{0});
  EXPECT_FALSE(auction->highest_bidder.has_value());
  EXPECT_EQ(view.pending().owed(fixture.who.bob), amount_t{150});
  EXPECT_FALSE(view.vault().record(7)->listed);
  EXPECT_TRUE(view.vault().in_custody(7));

  // Unlisted again, the asset can leave custody.
  ASSERT_FALSE(fixture.apply(fixture.who.alice,
                             withdraw_asset_t{.asset_id = 7}));
  EXPECT_EQ(code_of(fixture.apply(fixture.who.carol,
                                  cancel_auction_t{.asset_id = 7})),
            transaction_error_code::auction_not_active);
}

TEST(auction_engine, duration_updates_are_governance_only) {
  auto fixture = world_fixture{};
  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  set_auction_duration_t{.duration = 1'000})),
            transaction_error_code::authority_unset);
  ASSERT_FALSE(fixture.apply(fixture.who.owner,
                             set_authority_t{.governance_authority =
                                                 fixture.who.carol}));
  EXPECT_EQ(code_of(fixture.apply(fixture.who.owner,
                                  set_auction_duration_t{.duration = 1'000})),
            transaction_error_code::unauthorized);
  EXPECT_EQ(code_of(fixture.apply(fixture.who.carol,
                                  set_auction_duration_t{.duration = 0})),
            transaction_error_code::invalid_duration);
  ASSERT_FALSE(fixture.apply(fixture.who.carol,
                             set_auction_duration_t{.duration = 1'000}));
  EXPECT_EQ(fixture.view().auctions().parameters().auction_duration, 1'000u);
}
