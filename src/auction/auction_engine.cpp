#include <tessera/auction/auction_engine.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using namespace tessera::schema;
using tessera::common::busy_marker;
using tessera::common::fail;
using tessera::common::status_t;

namespace {

std::string auction_resource(const asset_id_t asset_id) {
  return fmt::format("auction:{}", asset_id);
}

status_t not_active(const asset_id_t asset_id) {
  return fail(transaction_error_code::auction_not_active,
              fmt::format("no active auction for asset {}", asset_id));
}

}  // namespace

namespace tessera::auction {

auction_engine::auction_engine(
    auction_book_t& book,
    tessera::custody::custody_port& custody,
    tessera::payments::pending_payment_ledger& pending,
    tessera::custody::value_rail& rail,
    tessera::common::busy_set_t& busy,
    tessera::common::event_journal& journal)
    : book_{book},
      custody_{custody},
      pending_{pending},
      rail_{rail},
      busy_{busy},
      journal_{journal} {}

status_t auction_engine::start(const asset_id_t asset_id,
                               const amount_t& starting_price,
                               const duration_milliseconds_t duration,
                               const address_t& caller,
                               const timestamp_milliseconds_t now) {
  if (caller != custody_.owner()) {
    return fail(transaction_error_code::unauthorized,
                "only the vault owner may start auctions");
  }
  if (duration != book_.parameters.auction_duration) {
    return fail(transaction_error_code::duration_mismatch,
                fmt::format("auction duration must be exactly {} ms",
                            book_.parameters.auction_duration));
  }
  if (!custody_.in_custody(asset_id)) {
    return fail(transaction_error_code::not_in_custody,
                fmt::format("asset {} is not in custody", asset_id));
  }
  auto existing = book_.auctions.find(asset_id);
  if (existing != std::end(book_.auctions) && existing->second.is_active) {
    return fail(transaction_error_code::auction_active,
                fmt::format("asset {} already has an active auction",
                            asset_id));
  }

  book_.auctions[asset_id] = auction_state_t{.is_active = true,
                                             .started_at = now,
                                             .end_time = now + duration,
                                             .starting_price = starting_price,
                                             .highest_bid = starting_price,
                                             .highest_bidder = std::nullopt,
                                             .total_bids = 0,
                                             .extensions = 0};
  custody_.set_listed(asset_id, true);
  journal_.emit("auction_started",
                {{"asset_id", std::to_string(asset_id)},
                 {"starting_price", to_string(starting_price)},
                 {"end_time", std::to_string(now + duration)}});
  return std::nullopt;
}

status_t auction_engine::bid(const asset_id_t asset_id,
                             const amount_t& payment,
                             const address_t& caller,
                             const timestamp_milliseconds_t now) {
  auto entry = book_.auctions.find(asset_id);
  if (entry == std::end(book_.auctions) || !entry->second.is_active) {
    return not_active(asset_id);
  }
  auto& auction = entry->second;
  if (now >= auction.end_time) {
    return fail(transaction_error_code::auction_expired,
                fmt::format("auction for asset {} has passed its end time",
                            asset_id));
  }
  if (payment <= auction.highest_bid) {
    return fail(transaction_error_code::bid_too_low,
                fmt::format("bid must exceed {}",
                            to_string(auction.highest_bid)));
  }
  auto marker = busy_marker::try_acquire(busy_, auction_resource(asset_id));
  if (!marker) {
    return fail(transaction_error_code::reentrancy_rejected,
                fmt::format("auction for asset {} is mid-settlement",
                            asset_id));
  }
  if (auto error = rail_.collect(caller, payment)) {
    return error;
  }

  if (auction.highest_bidder.has_value()) {
    pending_.credit(*auction.highest_bidder, auction.highest_bid, "outbid");
  }
  auction.highest_bid = payment;
  auction.highest_bidder = caller;
  ++auction.total_bids;

  journal_.emit("bid_placed", {{"asset_id", std::to_string(asset_id)},
                               {"bidder", to_hex(caller)},
                               {"amount", to_string(payment)}});

  const auto& parameters = book_.parameters;
  const auto inside_window =
      auction.end_time - now <= parameters.anti_snipe_window;
  const auto under_cap = !parameters.max_extensions.has_value() ||
                         auction.extensions < *parameters.max_extensions;
  if (inside_window && under_cap) {
    auction.end_time += parameters.extension;
    ++auction.extensions;
    journal_.emit("auction_extended",
                  {{"asset_id", std::to_string(asset_id)},
                   {"end_time", std::to_string(auction.end_time)},
                   {"extensions", std::to_string(auction.extensions)}});
  }
  return std::nullopt;
}

status_t auction_engine::end(const asset_id_t asset_id,
                             const address_t& caller,
                             const timestamp_milliseconds_t now) {
  auto entry = book_.auctions.find(asset_id);
  if (entry == std::end(book_.auctions) || !entry->second.is_active) {
    return not_active(asset_id);
  }
  auto& auction = entry->second;
  if (now < auction.end_time) {
    return fail(transaction_error_code::auction_not_ended,
                fmt::format("auction for asset {} ends at {}", asset_id,
                            auction.end_time));
  }
  if (!auction.highest_bidder.has_value()) {
    return fail(transaction_error_code::no_bids,
                fmt::format("auction for asset {} has no bids", asset_id));
  }
  auto original_owner = custody_.original_owner(asset_id);
  if (!original_owner.has_value()) {
    return fail(transaction_error_code::not_in_custody,
                fmt::format("asset {} has no custody record", asset_id));
  }
  auto marker = busy_marker::try_acquire(busy_, auction_resource(asset_id));
  if (!marker) {
    return fail(transaction_error_code::reentrancy_rejected,
                fmt::format("auction for asset {} is mid-settlement",
                            asset_id));
  }

  const auto winner = *auction.highest_bidder;
  const auto price = auction.highest_bid;
  // The asset move is the only step that can fail, so it goes first.
  if (auto error = custody_.release_to(asset_id, winner)) {
    return error;
  }
  const auto royalty = price * custody_.royalty_percentage() / 100;
  pending_.credit(*original_owner, royalty, "royalty");
  auction.is_active = false;
  // Proceeds are the full price; the royalty is paid on top of it.
  if (auto error = custody_.record_sale_proceeds(asset_id, price)) {
    return error;
  }

  spdlog::debug("Auction for asset {} settled at {} by {}", asset_id,
                to_string(price), to_hex(caller));
  journal_.emit("auction_ended", {{"asset_id", std::to_string(asset_id)},
                                  {"winner", to_hex(winner)},
                                  {"price", to_string(price)},
                                  {"royalty", to_string(royalty)}});
  return std::nullopt;
}

status_t auction_engine::cancel(const asset_id_t asset_id,
                                const address_t& caller) {
  if (auto error = require_governance(caller, "auction cancellation")) {
    return error;
  }
  auto entry = book_.auctions.find(asset_id);
  if (entry == std::end(book_.auctions) || !entry->second.is_active) {
    return not_active(asset_id);
  }
  auto& auction = entry->second;
  auction.is_active = false;
  const auto refund = auction.highest_bid;
  const auto bidder = auction.highest_bidder;
  if (bidder.has_value()) {
    pending_.credit(*bidder, refund, "auction_cancelled");
  }
  auction.highest_bid = 0;
  auction.highest_bidder = std::nullopt;
  custody_.set_listed(asset_id, false);

  journal_.emit("auction_cancelled",
                {{"asset_id", std::to_string(asset_id)},
                 {"refunded", bidder.has_value() ? to_string(refund) : "0"}});
  return std::nullopt;
}

status_t auction_engine::set_auction_duration(
    const address_t& caller,
    const duration_milliseconds_t duration) {
  if (auto error = require_governance(caller, "auction duration updates")) {
    return error;
  }
  if (duration == 0) {
    return fail(transaction_error_code::invalid_duration,
                "auction duration must be positive");
  }
  const auto previous = book_.parameters.auction_duration;
  book_.parameters.auction_duration = duration;
  journal_.emit("parameter_updated",
                {{"parameter", "auction_duration"},
                 {"previous", std::to_string(previous)},
                 {"value", std::to_string(duration)}});
  return std::nullopt;
}

std::optional<auction_state_t> auction_engine::auction(
    const asset_id_t asset_id) const {
  auto entry = book_.auctions.find(asset_id);
  if (entry == std::end(book_.auctions)) {
    return std::nullopt;
  }
  return entry->second;
}

status_t auction_engine::require_governance(const address_t& caller,
                                            const std::string_view what) const {
  auto authority = custody_.governance_authority();
  if (!authority.has_value()) {
    return fail(transaction_error_code::authority_unset,
                fmt::format("{}: governance authority is not set", what));
  }
  if (*authority != caller) {
    return fail(transaction_error_code::unauthorized,
                fmt::format("{}: caller is not the governance authority", what));
  }
  return std::nullopt;
}

}  // namespace tessera::auction
