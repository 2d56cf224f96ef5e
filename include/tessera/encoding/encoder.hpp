#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tessera::encoding {

// The codec is a build-time choice selected by tag; see scale/encoder.hpp.
// Schema types are plain aggregates so any codec that can walk aggregate
// members can serve them without per-type glue.
template <typename Library>
struct encoder {
  template <typename T>
  tessera::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tessera::schema::bytes_t& out);

  template <typename T>
  T decode(const tessera::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tessera::schema::bytes_view_t& bytes);
};

}  // namespace tessera::encoding
