#include <tessera/execution/runtime.hpp>

using namespace tessera::schema;
using tessera::common::status_t;

namespace tessera::execution {

runtime::runtime(world_state_t& world,
                 const timestamp_milliseconds_t now,
                 tessera::custody::receive_hook_t receive_hook)
    : now_{now},
      busy_{},
      journal_{},
      fractions_{world.fractions, journal_},
      registry_{world.registry},
      rail_{world.rail, std::move(receive_hook)},
      pending_{world.pending, rail_, busy_, journal_},
      vault_{world.custody, world.owner, fractions_, registry_,
             rail_,         busy_,       journal_},
      auctions_{world.auctions, vault_, pending_, rail_, busy_, journal_},
      timelock_{world.timelock,
                world.governance.parameters.timelock_delay,
                world.owner,
                [this](const governance_call_t& call,
                       const address_t& caller) {
                  return dispatch(call, caller);
                },
                journal_},
      governance_{world.governance, fractions_, timelock_, journal_} {}

status_t runtime::apply(const address_t& signer,
                        const transaction_payload_t& payload) {
  auto status = status_t{};
  std::visit(
      overloaded{
          [&](const deposit_t& value) {
            status = vault_.deposit(value.asset_ids, signer);
          },
          [&](const withdraw_asset_t& value) {
            status = vault_.withdraw(value.asset_id, signer);
          },
          [&](const redeem_t& value) {
            status = vault_.redeem(value.asset_id, value.fraction_amount,
                                   signer);
          },
          [&](const set_authority_t& value) {
            status = vault_.set_authority(signer, value.governance_authority);
          },
          [&](const transfer_fractions_t& value) {
            status = fractions_.transfer(signer, value.to, value.amount);
          },
          [&](const start_auction_t& value) {
            status = auctions_.start(value.asset_id, value.starting_price,
                                     value.duration, signer, now_);
          },
          [&](const place_bid_t& value) {
            status = auctions_.bid(value.asset_id, value.amount, signer, now_);
          },
          [&](const end_auction_t& value) {
            status = auctions_.end(value.asset_id, signer, now_);
          },
          [&](const cancel_auction_t& value) {
            status = auctions_.cancel(value.asset_id, signer);
          },
          [&](const set_auction_duration_t& value) {
            status = auctions_.set_auction_duration(signer, value.duration);
          },
          [&](const set_royalty_percentage_t& value) {
            status = vault_.set_royalty_percentage(signer, value.percentage);
          },
          [&](const withdraw_pending_t&) { status = pending_.withdraw(signer); },
          [&](const create_proposal_t& value) {
            status = governance_.create_proposal(signer, value.description,
                                                 value.call, now_);
          },
          [&](const cast_vote_t& value) {
            status = governance_.vote(value.proposal_id, value.support, signer,
                                      now_);
          },
          [&](const execute_proposal_t& value) {
            status = governance_.execute_proposal(value.proposal_id, now_);
          },
          [&](const execute_scheduled_call_t& value) {
            status = timelock_.execute(value.call_id, now_);
          },
          [&](const cancel_scheduled_call_t& value) {
            status = timelock_.cancel(value.call_id, signer);
          }},
      payload);
  return status;
}

status_t runtime::dispatch(const governance_call_t& call,
                           const address_t& caller) {
  auto status = status_t{};
  std::visit(overloaded{[&](const set_auction_duration_action_t& action) {
                          status = auctions_.set_auction_duration(
                              caller, action.duration);
                        },
                        [&](const set_royalty_percentage_action_t& action) {
                          status = vault_.set_royalty_percentage(
                              caller, action.percentage);
                        },
                        [&](const cancel_auction_action_t& action) {
                          status = auctions_.cancel(action.asset_id, caller);
                        }},
             call.action);
  return status;
}

std::string_view codespace(const transaction_payload_t& payload) {
  auto name = std::string_view{};
  std::visit(
      overloaded{
          [&](const deposit_t&) { name = "tessera.custody"; },
          [&](const withdraw_asset_t&) { name = "tessera.custody"; },
          [&](const redeem_t&) { name = "tessera.custody"; },
          [&](const set_authority_t&) { name = "tessera.custody"; },
          [&](const set_royalty_percentage_t&) { name = "tessera.custody"; },
          [&](const transfer_fractions_t&) { name = "tessera.fractions"; },
          [&](const start_auction_t&) { name = "tessera.auction"; },
          [&](const place_bid_t&) { name = "tessera.auction"; },
          [&](const end_auction_t&) { name = "tessera.auction"; },
          [&](const cancel_auction_t&) { name = "tessera.auction"; },
          [&](const set_auction_duration_t&) { name = "tessera.auction"; },
          [&](const withdraw_pending_t&) { name = "tessera.payments"; },
          [&](const create_proposal_t&) { name = "tessera.governance"; },
          [&](const cast_vote_t&) { name = "tessera.governance"; },
          [&](const execute_proposal_t&) { name = "tessera.governance"; },
          [&](const execute_scheduled_call_t&) { name = "tessera.timelock"; },
          [&](const cancel_scheduled_call_t&) { name = "tessera.timelock"; }},
      payload);
  return name;
}

}  // namespace tessera::execution
