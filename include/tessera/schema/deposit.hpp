#pragma once
#include <tessera/schema/primitives.hpp>
#include <vector>

// Schema type: deposit.
// Custody workflow: Lock one or more unique assets into custody and mint
// fraction claims to the depositor; all-or-nothing per batch.
namespace tessera::schema {

template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
  std::vector<asset_id_t> asset_ids;
};

using deposit_t = deposit<1>;

}  // namespace tessera::schema
