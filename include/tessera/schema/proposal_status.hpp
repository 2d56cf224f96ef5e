#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal status.
// Custody workflow: Read-side projection of the proposal lifecycle; never
// stored.
namespace tessera::schema {

enum class proposal_status_t : uint8_t {
  pending = 0,
  active = 1,
  voting_ended = 2,
  approved = 3,
  rejected = 4
};

inline constexpr auto kProposalStatusMappings =
    std::array{enum_mapping_t<proposal_status_t>{
                   "Pending", proposal_status_t::pending},
               enum_mapping_t<proposal_status_t>{
                   "Active", proposal_status_t::active},
               enum_mapping_t<proposal_status_t>{
                   "Voting Ended", proposal_status_t::voting_ended},
               enum_mapping_t<proposal_status_t>{
                   "Approved", proposal_status_t::approved},
               enum_mapping_t<proposal_status_t>{
                   "Rejected", proposal_status_t::rejected}};

template <>
inline std::optional<proposal_status_t> try_from_string<proposal_status_t>(
    const std::string_view value) {
  return from_string(value, kProposalStatusMappings);
}

inline constexpr std::string_view to_string(const proposal_status_t value) {
  return enum_name(value, kProposalStatusMappings);
}

}  // namespace tessera::schema
