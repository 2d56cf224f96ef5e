#pragma once

#include <tessera/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Custody workflow: Event stream item: append-only record of a state change
// for external observers and auditors.
namespace tessera::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

/// Value of the first attribute named `key`, or empty when absent.
std::string find_attribute(const transaction_event_t& event,
                           const std::string& key);

}  // namespace tessera::schema
