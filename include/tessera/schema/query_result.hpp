#pragma once

#include <tessera/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Custody workflow: Read API envelope: SCALE-encoded value for a route and
// key, the committed height it was read at, and error metadata.
namespace tessera::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  bytes_t key;
  bytes_t value;
  int64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace tessera::schema
