#pragma once
#include <tessera/schema/primitives.hpp>

// Schema type: cast vote.
// Custody workflow: Weighted vote by current claim balance; one per address.
namespace tessera::schema {

template <uint16_t Version>
struct cast_vote;

template <>
struct cast_vote<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  bool support{};
};

using cast_vote_t = cast_vote<1>;

}  // namespace tessera::schema
