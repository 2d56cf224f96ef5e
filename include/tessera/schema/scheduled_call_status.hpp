#pragma once

#include <tessera/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace tessera::schema {

enum class scheduled_call_status_t : uint8_t {
  pending = 0,
  executed = 1,
  cancelled = 2
};

inline constexpr auto kScheduledCallStatusMappings =
    std::array{enum_mapping_t<scheduled_call_status_t>{
                   "pending", scheduled_call_status_t::pending},
               enum_mapping_t<scheduled_call_status_t>{
                   "executed", scheduled_call_status_t::executed},
               enum_mapping_t<scheduled_call_status_t>{
                   "cancelled", scheduled_call_status_t::cancelled}};

template <>
inline std::optional<scheduled_call_status_t>
try_from_string<scheduled_call_status_t>(const std::string_view value) {
  return from_string(value, kScheduledCallStatusMappings);
}

inline constexpr std::string_view to_string(
    const scheduled_call_status_t value) {
  return enum_name(value, kScheduledCallStatusMappings);
}

}  // namespace tessera::schema
