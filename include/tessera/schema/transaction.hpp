#pragma once
#include <tessera/schema/cancel_auction.hpp>
#include <tessera/schema/cancel_scheduled_call.hpp>
#include <tessera/schema/cast_vote.hpp>
#include <tessera/schema/create_proposal.hpp>
#include <tessera/schema/deposit.hpp>
#include <tessera/schema/end_auction.hpp>
#include <tessera/schema/execute_proposal.hpp>
#include <tessera/schema/execute_scheduled_call.hpp>
#include <tessera/schema/place_bid.hpp>
#include <tessera/schema/primitives.hpp>
#include <tessera/schema/redeem.hpp>
#include <tessera/schema/set_auction_duration.hpp>
#include <tessera/schema/set_authority.hpp>
#include <tessera/schema/set_royalty_percentage.hpp>
#include <tessera/schema/start_auction.hpp>
#include <tessera/schema/transfer_fractions.hpp>
#include <tessera/schema/withdraw_asset.hpp>
#include <tessera/schema/withdraw_pending.hpp>
#include <variant>

namespace tessera::schema {

using transaction_payload_t = std::variant<deposit_t,
                                           withdraw_asset_t,
                                           redeem_t,
                                           set_authority_t,
                                           transfer_fractions_t,
                                           start_auction_t,
                                           place_bid_t,
                                           end_auction_t,
                                           cancel_auction_t,
                                           set_auction_duration_t,
                                           set_royalty_percentage_t,
                                           withdraw_pending_t,
                                           create_proposal_t,
                                           cast_vote_t,
                                           execute_proposal_t,
                                           execute_scheduled_call_t,
                                           cancel_scheduled_call_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  address_t signer{};
  transaction_payload_t payload{};
  ed25519_signature_t signature{};
};

using transaction_t = transaction<1>;

/// Name used for logging and the `operation` event attribute.
std::string_view payload_name(const transaction_payload_t& payload);

}  // namespace tessera::schema
