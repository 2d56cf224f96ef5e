#include <tessera/schema/transaction.hpp>
#include <tessera/schema/transaction_event.hpp>

namespace tessera::schema {

std::string_view payload_name(const transaction_payload_t& payload) {
  auto name = std::string_view{};
  std::visit(overloaded{[&](const deposit_t&) { name = "deposit"; },
                        [&](const withdraw_asset_t&) { name = "withdraw"; },
                        [&](const redeem_t&) { name = "redeem"; },
                        [&](const set_authority_t&) {
                          name = "set_authority";
                        },
                        [&](const transfer_fractions_t&) {
                          name = "transfer_fractions";
                        },
                        [&](const start_auction_t&) {
                          name = "start_auction";
                        },
                        [&](const place_bid_t&) { name = "bid"; },
                        [&](const end_auction_t&) { name = "end_auction"; },
                        [&](const cancel_auction_t&) {
                          name = "cancel_auction";
                        },
                        [&](const set_auction_duration_t&) {
                          name = "set_auction_duration";
                        },
                        [&](const set_royalty_percentage_t&) {
                          name = "set_royalty_percentage";
                        },
                        [&](const withdraw_pending_t&) {
                          name = "withdraw_pending";
                        },
                        [&](const create_proposal_t&) {
                          name = "create_proposal";
                        },
                        [&](const cast_vote_t&) { name = "vote"; },
                        [&](const execute_proposal_t&) {
                          name = "execute_proposal";
                        },
                        [&](const execute_scheduled_call_t&) {
                          name = "execute_scheduled_call";
                        },
                        [&](const cancel_scheduled_call_t&) {
                          name = "cancel_scheduled_call";
                        }},
             payload);
  return name;
}

std::string find_attribute(const transaction_event_t& event,
                           const std::string& key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace tessera::schema
