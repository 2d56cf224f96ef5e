#pragma once
#include <cstdint>

namespace tessera::schema {

inline constexpr auto kFractionsPerAsset = uint64_t{1000};
inline constexpr auto kDefaultRoyaltyPercentage = uint32_t{5};

template <uint16_t Version>
struct vault_parameters;

template <>
struct vault_parameters<1> final {
  uint16_t version{1};
  uint32_t royalty_percentage{kDefaultRoyaltyPercentage};
};

using vault_parameters_t = vault_parameters<1>;

}  // namespace tessera::schema
