#include <tessera/schema/governance_call.hpp>

namespace tessera::schema {

governance_target_t owning_target(const governance_action_t& action) {
  auto target = governance_target_t::auction_engine;
  std::visit(overloaded{[&](const set_auction_duration_action_t&) {
                          target = governance_target_t::auction_engine;
                        },
                        [&](const set_royalty_percentage_action_t&) {
                          target = governance_target_t::custody_vault;
                        },
                        [&](const cancel_auction_action_t&) {
                          target = governance_target_t::auction_engine;
                        }},
             action);
  return target;
}

std::string_view action_name(const governance_action_t& action) {
  auto name = std::string_view{};
  std::visit(overloaded{[&](const set_auction_duration_action_t&) {
                          name = "set_auction_duration";
                        },
                        [&](const set_royalty_percentage_action_t&) {
                          name = "set_royalty_percentage";
                        },
                        [&](const cancel_auction_action_t&) {
                          name = "cancel_auction";
                        }},
             action);
  return name;
}

}  // namespace tessera::schema
