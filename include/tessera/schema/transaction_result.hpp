#pragma once

#include <tessera/schema/primitives.hpp>
#include <tessera/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Outcome of checking or executing one transaction. code is 0 on success,
// otherwise a transaction_error_code; codespace names the rejecting component.
namespace tessera::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

inline bool accepted(const transaction_result_t& result) {
  return result.code == 0;
}

}  // namespace tessera::schema
