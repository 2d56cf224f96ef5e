#pragma once

#include <tessera/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Custody workflow: Durable checkpoint written after a finalized block:
// height, state root, and the number of events appended to the log.
namespace tessera::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
  uint64_t events_persisted{};
};

using commit_result_t = commit_result<1>;

}  // namespace tessera::schema
