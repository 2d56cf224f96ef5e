#include <gtest/gtest.h>
#include <tessera/schema/transaction_error_code.hpp>

using tessera::schema::category_of;
using tessera::schema::error_category;
using tessera::schema::transaction_error_code;

TEST(transaction_error_code, envelope_errors_are_malformed) {
  EXPECT_EQ(category_of(transaction_error_code::invalid_transaction),
            error_category::malformed);
  EXPECT_EQ(category_of(transaction_error_code::invalid_nonce),
            error_category::malformed);
  EXPECT_EQ(category_of(transaction_error_code::reserved_signer),
            error_category::malformed);
  EXPECT_EQ(category_of(transaction_error_code::signature_verification_failed),
            error_category::malformed);
  EXPECT_EQ(category_of(transaction_error_code::invalid_block_height),
            error_category::malformed);
  EXPECT_EQ(category_of(transaction_error_code::invalid_block_time),
            error_category::malformed);
}

TEST(transaction_error_code, component_errors_map_to_caller_facing_classes) {
  EXPECT_EQ(category_of(transaction_error_code::unauthorized),
            error_category::unauthorized);
  EXPECT_EQ(category_of(transaction_error_code::already_set),
            error_category::already_set);
  EXPECT_EQ(category_of(transaction_error_code::insufficient_claims),
            error_category::insufficient_funds);
  EXPECT_EQ(category_of(transaction_error_code::no_funds),
            error_category::insufficient_funds);
  EXPECT_EQ(category_of(transaction_error_code::reentrancy_rejected),
            error_category::transfer_failed);
  EXPECT_EQ(category_of(transaction_error_code::bid_too_low),
            error_category::precondition_failed);
  EXPECT_EQ(category_of(transaction_error_code::quorum_not_met),
            error_category::precondition_failed);
  EXPECT_EQ(category_of(transaction_error_code::authority_unset),
            error_category::precondition_failed);
}

TEST(transaction_error_code, categories_have_stable_names) {
  EXPECT_EQ(tessera::schema::to_string(error_category::precondition_failed),
            "precondition_failed");
  EXPECT_EQ(tessera::schema::to_string(error_category::transfer_failed),
            "transfer_failed");
  static_assert(static_cast<uint32_t>(transaction_error_code::reserved_signer) ==
                5);
}
