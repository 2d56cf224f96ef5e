#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tessera::schema {

enum class governance_target_t : uint8_t {
  custody_vault = 0,
  auction_engine = 1
};

inline constexpr auto kGovernanceTargetMappings =
    std::array{enum_mapping_t<governance_target_t>{
                   "custody_vault", governance_target_t::custody_vault},
               enum_mapping_t<governance_target_t>{
                   "auction_engine", governance_target_t::auction_engine}};

template <>
inline std::optional<governance_target_t> try_from_string<governance_target_t>(
    const std::string_view value) {
  return from_string(value, kGovernanceTargetMappings);
}

inline constexpr std::string_view to_string(const governance_target_t value) {
  return enum_name(value, kGovernanceTargetMappings);
}

}  // namespace tessera::schema
