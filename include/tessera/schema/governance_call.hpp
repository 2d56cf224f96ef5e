#pragma once
#include <tessera/schema/governance_target.hpp>
#include <tessera/schema/primitives.hpp>
#include <variant>

// Schema type: governance call.
// Custody workflow: Parameter mutation or auction cancellation a passed
// proposal schedules on the timelock.
namespace tessera::schema {

struct set_auction_duration_action_t final {
  duration_milliseconds_t duration{};
};

struct set_royalty_percentage_action_t final {
  uint32_t percentage{};
};

struct cancel_auction_action_t final {
  asset_id_t asset_id{};
};

using governance_action_t = std::variant<set_auction_duration_action_t,
                                         set_royalty_percentage_action_t,
                                         cancel_auction_action_t>;

template <uint16_t Version>
struct governance_call;

template <>
struct governance_call<1> final {
  uint16_t version{1};
  governance_target_t target{};
  governance_action_t action;
};

using governance_call_t = governance_call<1>;

/// Component that owns the state an action mutates.
governance_target_t owning_target(const governance_action_t& action);

std::string_view action_name(const governance_action_t& action);

}  // namespace tessera::schema
