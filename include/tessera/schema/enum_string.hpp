#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Each enum header defines a constexpr table of
// enum_mapping_t entries and specializes try_from_string for its type.
namespace tessera::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  return to_string(value, mappings).value_or(kUnknownEnumName);
}

// Only enums with a name table specialize this.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

}  // namespace tessera::schema
