#include <tessera/custody/asset_registry.hpp>

#include <spdlog/fmt/fmt.h>

using namespace tessera::schema;
using tessera::common::fail;
using tessera::common::status_t;

namespace tessera::custody {

asset_registry::asset_registry(asset_registry_state_t& state)
    : state_{state} {}

std::optional<address_t> asset_registry::owner_of(
    const asset_id_t asset_id) const {
  auto owner = state_.owners.find(asset_id);
  if (owner == std::end(state_.owners)) {
    return std::nullopt;
  }
  return owner->second;
}

status_t asset_registry::transfer(const address_t& from,
                                  const address_t& to,
                                  const asset_id_t asset_id) {
  auto owner = state_.owners.find(asset_id);
  if (owner == std::end(state_.owners)) {
    return fail(transaction_error_code::transfer_failed,
                fmt::format("asset {} does not exist", asset_id));
  }
  if (owner->second != from) {
    return fail(transaction_error_code::transfer_failed,
                fmt::format("asset {} is not owned by {}", asset_id,
                            to_hex(from)));
  }
  owner->second = to;
  return std::nullopt;
}

status_t asset_registry::register_asset(const asset_id_t asset_id,
                                        const address_t& owner) {
  if (state_.owners.contains(asset_id)) {
    return fail(transaction_error_code::already_set,
                fmt::format("asset {} is already registered", asset_id));
  }
  state_.owners.emplace(asset_id, owner);
  return std::nullopt;
}

}  // namespace tessera::custody
