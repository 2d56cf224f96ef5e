#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>

// Schema type: auction parameters.
// Custody workflow: Governance-mutable auction timing. `max_extensions`
// unset means late bids extend without limit.
namespace tessera::schema {

template <uint16_t Version>
struct auction_parameters;

template <>
struct auction_parameters<1> final {
  uint16_t version{1};
  duration_milliseconds_t auction_duration{kDayMilliseconds};
  duration_milliseconds_t anti_snipe_window{15 * kMinuteMilliseconds};
  duration_milliseconds_t extension{15 * kMinuteMilliseconds};
  std::optional<uint32_t> max_extensions;
};

using auction_parameters_t = auction_parameters<1>;

}  // namespace tessera::schema
