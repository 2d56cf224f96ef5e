#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: asset record.
// Custody workflow: Per-asset custody ledger entry: lock flag, depositor, and
// unredeemed sale proceeds owed to fraction holders.
namespace tessera::schema {

template <uint16_t Version>
struct asset_record;

template <>
struct asset_record<1> final {
  uint16_t version{1};
  bool in_custody{};
  address_t original_owner{};
  amount_t sale_proceeds{};
  bool listed{};
};

using asset_record_t = asset_record<1>;

}  // namespace tessera::schema
