#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace tessera::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  reserved_signer = 5,
  signature_verification_failed = 6,
  invalid_block_height = 7,
  invalid_block_time = 8,

  // Custody vault.
  not_in_custody = 10,
  insufficient_claims = 11,
  no_proceeds = 12,
  supply_zero = 13,
  already_in_custody = 14,
  duplicate_asset = 15,
  empty_batch = 16,
  asset_listed = 17,
  invalid_amount = 18,

  // Shared authorization and one-time configuration.
  unauthorized = 20,
  already_set = 21,
  authority_unset = 22,

  // Value movement.
  transfer_failed = 30,
  insufficient_funds = 31,
  no_funds = 32,
  reentrancy_rejected = 33,

  // Auction engine.
  auction_active = 40,
  auction_not_active = 41,
  auction_expired = 42,
  auction_not_ended = 43,
  bid_too_low = 44,
  no_bids = 45,
  duration_mismatch = 46,
  invalid_duration = 47,

  // Governance controller and timelock.
  proposal_threshold_not_met = 50,
  proposal_missing = 51,
  voting_closed = 52,
  already_voted = 53,
  no_voting_power = 54,
  voting_not_ended = 55,
  proposal_already_executed = 56,
  quorum_not_met = 57,
  proposal_rejected = 58,
  invalid_governance_call = 59,
  scheduled_call_missing = 60,
  scheduled_call_not_ready = 61,
  scheduled_call_finalized = 62,
  invalid_percentage = 63,
};

/// Caller-facing failure classes.
enum class error_category : uint8_t {
  none = 0,
  precondition_failed = 1,
  unauthorized = 2,
  insufficient_funds = 3,
  already_set = 4,
  transfer_failed = 5,
  malformed = 6
};

constexpr error_category category_of(const transaction_error_code code) {
  using enum transaction_error_code;
  switch (code) {
    case invalid_transaction:
    case unsupported_transaction_version:
    case invalid_chain_id:
    case invalid_nonce:
    case reserved_signer:
    case signature_verification_failed:
    case invalid_block_height:
    case invalid_block_time:
      return error_category::malformed;
    case unauthorized:
      return error_category::unauthorized;
    case already_set:
      return error_category::already_set;
    case insufficient_claims:
    case insufficient_funds:
    case no_funds:
      return error_category::insufficient_funds;
    case transfer_failed:
    case reentrancy_rejected:
      return error_category::transfer_failed;
    default:
      return error_category::precondition_failed;
  }
}

inline constexpr auto kErrorCategoryMappings = std::array{
    enum_mapping_t<error_category>{"none", error_category::none},
    enum_mapping_t<error_category>{"precondition_failed",
                                   error_category::precondition_failed},
    enum_mapping_t<error_category>{"unauthorized",
                                   error_category::unauthorized},
    enum_mapping_t<error_category>{"insufficient_funds",
                                   error_category::insufficient_funds},
    enum_mapping_t<error_category>{"already_set", error_category::already_set},
    enum_mapping_t<error_category>{"transfer_failed",
                                   error_category::transfer_failed},
    enum_mapping_t<error_category>{"malformed", error_category::malformed}};

inline constexpr std::string_view to_string(const error_category value) {
  return enum_name(value, kErrorCategoryMappings);
}

}  // namespace tessera::schema
