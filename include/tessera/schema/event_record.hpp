#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Custody workflow: Persisted, sequence-numbered copy of a transaction event.
namespace tessera::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t tx_index{};
  address_t signer{};
  timestamp_milliseconds_t recorded_at{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace tessera::schema
