#pragma once
#include <tessera/schema/governance_call.hpp>
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tessera::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t proposal_id{};
  address_t proposer{};
  std::string description;
  governance_call_t call;
  timestamp_milliseconds_t voting_start{};
  timestamp_milliseconds_t voting_end{};
  bool executed{};
  amount_t votes_for{};
  amount_t votes_against{};
  amount_t total_votes{};
  amount_t supply_snapshot{};
  std::vector<address_t> voters;
  std::optional<call_id_t> scheduled_call_id;
};

using proposal_state_t = proposal_state<1>;

}  // namespace tessera::schema
