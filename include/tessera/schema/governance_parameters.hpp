#pragma once
#include <tessera/schema/primitives.hpp>

namespace tessera::schema {

template <uint16_t Version>
struct governance_parameters;

template <>
struct governance_parameters<1> final {
  uint16_t version{1};
  uint32_t proposal_threshold_percentage{5};
  uint32_t quorum_percentage{20};
  duration_milliseconds_t voting_period{3 * kDayMilliseconds};
  duration_milliseconds_t timelock_delay{2 * kDayMilliseconds};
};

using governance_parameters_t = governance_parameters<1>;

}  // namespace tessera::schema
