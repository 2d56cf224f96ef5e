#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Custody workflow: Per-transaction outcomes of one block plus the candidate
// state root awaiting commit.
namespace tessera::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  uint64_t height{};
  timestamp_milliseconds_t block_time{};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace tessera::schema
