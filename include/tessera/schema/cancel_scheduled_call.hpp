#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: cancel scheduled call.
// Custody workflow: Timelock administrator drops a queued call before
// it runs.
namespace tessera::schema {

template <uint16_t Version>
struct cancel_scheduled_call;

template <>
struct cancel_scheduled_call<1> final {
  uint16_t version{1};
  call_id_t call_id{};
};

using cancel_scheduled_call_t = cancel_scheduled_call<1>;

}  // namespace tessera::schema
