#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: execute scheduled call.
// Custody workflow: Apply a queued call after its delay elapsed.
namespace tessera::schema {

template <uint16_t Version>
struct execute_scheduled_call;

template <>
struct execute_scheduled_call<1> final {
  uint16_t version{1};
  call_id_t call_id{};
};

using execute_scheduled_call_t = execute_scheduled_call<1>;

}  // namespace tessera::schema
