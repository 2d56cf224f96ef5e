#pragma once
#include <tessera/schema/governance_call.hpp>
#include <tessera/schema/primitives.hpp>
#include <string>

// Schema type: create proposal.
// Custody workflow: Open a governance proposal carrying one call.
namespace tessera::schema {

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  uint16_t version{1};
  std::string description;
  governance_call_t call;
};

using create_proposal_t = create_proposal<1>;

}  // namespace tessera::schema
