#include <tessera/common/critical.hpp>
#include <tessera/custody/custody_vault.hpp>
#include <tessera/custody/system_accounts.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <map>
#include <set>

using namespace tessera::schema;
using tessera::common::busy_marker;
using tessera::common::fail;
using tessera::common::status_t;

namespace {

std::string asset_resource(const asset_id_t asset_id) {
  return fmt::format("asset:{}", asset_id);
}

amount_t fractions_per_asset() {
  return amount_t{kFractionsPerAsset};
}

}  // namespace

namespace tessera::custody {

custody_vault::custody_vault(custody_state_t& state,
                             const address_t& owner,
                             claim_ledger& claims,
                             asset_registry& registry,
                             value_rail& rail,
                             tessera::common::busy_set_t& busy,
                             tessera::common::event_journal& journal)
    : state_{state},
      owner_{owner},
      claims_{claims},
      registry_{registry},
      rail_{rail},
      busy_{busy},
      journal_{journal} {}

status_t custody_vault::deposit(const std::vector<asset_id_t>& asset_ids,
                                const address_t& caller) {
  if (asset_ids.empty()) {
    return fail(transaction_error_code::empty_batch,
                "deposit requires at least one asset");
  }
  auto distinct = std::set<asset_id_t>{std::begin(asset_ids),
                                       std::end(asset_ids)};
  if (distinct.size() != asset_ids.size()) {
    return fail(transaction_error_code::duplicate_asset,
                "deposit batch lists an asset more than once");
  }

  auto markers = std::vector<busy_marker>{};
  markers.reserve(asset_ids.size());
  for (const auto asset_id : asset_ids) {
    if (in_custody(asset_id)) {
      return fail(transaction_error_code::already_in_custody,
                  fmt::format("asset {} is already in custody", asset_id));
    }
    auto marker = busy_marker::try_acquire(busy_, asset_resource(asset_id));
    if (!marker) {
      return fail(transaction_error_code::reentrancy_rejected,
                  fmt::format("asset {} is mid-transfer", asset_id));
    }
    markers.push_back(std::move(*marker));
  }

  auto previous = std::map<asset_id_t, std::optional<asset_record_t>>{};
  auto completed = std::vector<asset_id_t>{};
  completed.reserve(asset_ids.size());
  for (const auto asset_id : asset_ids) {
    previous.emplace(asset_id, record(asset_id));
    if (auto error = lock_one(asset_id, caller)) {
      std::for_each(std::rbegin(completed), std::rend(completed),
                    [&](const asset_id_t locked) {
                      unlock_one(locked, caller, previous.at(locked));
                    });
      return error;
    }
    completed.push_back(asset_id);
  }

  for (const auto asset_id : asset_ids) {
    journal_.emit("deposit",
                  {{"asset_id", std::to_string(asset_id)},
                   {"depositor", to_hex(caller)},
                   {"minted", to_string(fractions_per_asset())}});
  }
  return std::nullopt;
}

status_t custody_vault::lock_one(const asset_id_t asset_id,
                                 const address_t& caller) {
  if (auto error = registry_.transfer(caller, vault_address(), asset_id)) {
    return error;
  }
  const auto existed = state_.assets.contains(asset_id);
  auto& entry = state_.assets[asset_id];
  const auto previous = entry;
  entry.in_custody = true;
  entry.original_owner = caller;
  entry.listed = false;
  if (auto error =
          claims_.mint(vault_address(), caller, fractions_per_asset())) {
    if (existed) {
      entry = previous;
    } else {
      state_.assets.erase(asset_id);
    }
    if (auto undo = registry_.transfer(vault_address(), caller, asset_id)) {
      tessera::common::critical(
          "failed to return asset {} after mint failure: {}", asset_id,
          undo->reason);
    }
    return error;
  }
  return std::nullopt;
}

void custody_vault::unlock_one(const asset_id_t asset_id,
                               const address_t& caller,
                               const std::optional<asset_record_t>& previous) {
  if (auto error =
          claims_.burn_from(vault_address(), caller, fractions_per_asset())) {
    tessera::common::critical(
        "failed to burn claims for asset {} while unwinding deposit: {}",
        asset_id, error->reason);
  }
  if (auto error = registry_.transfer(vault_address(), caller, asset_id)) {
    tessera::common::critical(
        "failed to return asset {} while unwinding deposit: {}", asset_id,
        error->reason);
  }
  if (previous.has_value()) {
    state_.assets[asset_id] = *previous;
  } else {
    state_.assets.erase(asset_id);
  }
}

status_t custody_vault::withdraw(const asset_id_t asset_id,
                                 const address_t& caller) {
  auto entry = state_.assets.find(asset_id);
  if (entry == std::end(state_.assets) || !entry->second.in_custody) {
    return fail(transaction_error_code::not_in_custody,
                fmt::format("asset {} is not in custody", asset_id));
  }
  if (entry->second.listed) {
    return fail(transaction_error_code::asset_listed,
                fmt::format("asset {} is under an active auction", asset_id));
  }
  if (claims_.balance_of(caller) < fractions_per_asset()) {
    return fail(transaction_error_code::insufficient_claims,
                "withdrawal requires a full asset's worth of claims");
  }
  auto marker = busy_marker::try_acquire(busy_, asset_resource(asset_id));
  if (!marker) {
    return fail(transaction_error_code::reentrancy_rejected,
                fmt::format("asset {} is mid-transfer", asset_id));
  }

  if (auto error =
          claims_.burn_from(vault_address(), caller, fractions_per_asset())) {
    return error;
  }
  entry->second.in_custody = false;
  if (auto error = registry_.transfer(vault_address(), caller, asset_id)) {
    entry->second.in_custody = true;
    if (auto undo =
            claims_.mint(vault_address(), caller, fractions_per_asset())) {
      tessera::common::critical("failed to restore claims after withdrawal");
    }
    return error;
  }

  journal_.emit("withdrawal", {{"asset_id", std::to_string(asset_id)},
                               {"recipient", to_hex(caller)},
                               {"burned", to_string(fractions_per_asset())}});
  return std::nullopt;
}

status_t custody_vault::redeem(const asset_id_t asset_id,
                               const amount_t& fraction_amount,
                               const address_t& caller) {
  if (fraction_amount == 0) {
    return fail(transaction_error_code::invalid_amount,
                "redeem amount must be positive");
  }
  auto entry = state_.assets.find(asset_id);
  if (entry == std::end(state_.assets) || entry->second.sale_proceeds == 0) {
    return fail(transaction_error_code::no_proceeds,
                fmt::format("asset {} has no sale proceeds", asset_id));
  }
  const auto supply = claims_.total_supply();
  if (supply == 0) {
    return fail(transaction_error_code::supply_zero,
                "no fraction claims are outstanding");
  }
  if (claims_.balance_of(caller) < fraction_amount) {
    return fail(transaction_error_code::insufficient_claims,
                "caller holds fewer claims than requested");
  }
  auto marker = busy_marker::try_acquire(
      busy_, fmt::format("proceeds:{}", asset_id));
  if (!marker) {
    return fail(transaction_error_code::reentrancy_rejected,
                fmt::format("proceeds of asset {} are mid-payout", asset_id));
  }

  const auto payout = entry->second.sale_proceeds * fraction_amount / supply;
  entry->second.sale_proceeds -= payout;
  if (auto error = claims_.burn_from(vault_address(), caller, fraction_amount)) {
    entry->second.sale_proceeds += payout;
    return error;
  }
  if (auto error = rail_.pay(caller, payout)) {
    entry->second.sale_proceeds += payout;
    if (auto undo = claims_.mint(vault_address(), caller, fraction_amount)) {
      tessera::common::critical("failed to restore claims after redemption");
    }
    return error;
  }

  journal_.emit("redemption", {{"asset_id", std::to_string(asset_id)},
                               {"holder", to_hex(caller)},
                               {"burned", to_string(fraction_amount)},
                               {"payout", to_string(payout)}});
  return std::nullopt;
}

status_t custody_vault::set_authority(const address_t& caller,
                                      const address_t& governance_authority) {
  if (caller != owner_) {
    return fail(transaction_error_code::unauthorized,
                "only the vault owner may set the governance authority");
  }
  if (state_.governance_authority.has_value()) {
    return fail(transaction_error_code::already_set,
                "governance authority can only be set once");
  }
  state_.governance_authority = governance_authority;
  spdlog::info("Governance authority bound to {}",
               to_hex(governance_authority));
  journal_.emit("authority_set",
                {{"authority", to_hex(governance_authority)}});
  return std::nullopt;
}

status_t custody_vault::set_royalty_percentage(const address_t& caller,
                                               const uint32_t percentage) {
  if (!state_.governance_authority.has_value()) {
    return fail(transaction_error_code::authority_unset,
                "royalty updates need a governance authority");
  }
  if (*state_.governance_authority != caller) {
    return fail(transaction_error_code::unauthorized,
                "royalty updates are governance-only");
  }
  if (percentage > 100) {
    return fail(transaction_error_code::invalid_percentage,
                "royalty percentage must be within 0..100");
  }
  const auto previous = state_.parameters.royalty_percentage;
  state_.parameters.royalty_percentage = percentage;
  journal_.emit("parameter_updated",
                {{"parameter", "royalty_percentage"},
                 {"previous", std::to_string(previous)},
                 {"value", std::to_string(percentage)}});
  return std::nullopt;
}

std::optional<asset_record_t> custody_vault::record(
    const asset_id_t asset_id) const {
  auto entry = state_.assets.find(asset_id);
  if (entry == std::end(state_.assets)) {
    return std::nullopt;
  }
  return entry->second;
}

const address_t& custody_vault::owner() const {
  return owner_;
}

std::optional<address_t> custody_vault::governance_authority() const {
  return state_.governance_authority;
}

bool custody_vault::in_custody(const asset_id_t asset_id) const {
  auto entry = state_.assets.find(asset_id);
  return entry != std::end(state_.assets) && entry->second.in_custody;
}

std::optional<address_t> custody_vault::original_owner(
    const asset_id_t asset_id) const {
  auto entry = state_.assets.find(asset_id);
  if (entry == std::end(state_.assets)) {
    return std::nullopt;
  }
  return entry->second.original_owner;
}

uint32_t custody_vault::royalty_percentage() const {
  return state_.parameters.royalty_percentage;
}

void custody_vault::set_listed(const asset_id_t asset_id, const bool listed) {
  auto entry = state_.assets.find(asset_id);
  if (entry != std::end(state_.assets)) {
    entry->second.listed = listed;
  }
}

status_t custody_vault::release_to(const asset_id_t asset_id,
                                   const address_t& recipient) {
  if (!in_custody(asset_id)) {
    return fail(transaction_error_code::not_in_custody,
                fmt::format("asset {} is not in custody", asset_id));
  }
  return registry_.transfer(vault_address(), recipient, asset_id);
}

status_t custody_vault::record_sale_proceeds(const asset_id_t asset_id,
                                             const amount_t& amount) {
  auto entry = state_.assets.find(asset_id);
  if (entry == std::end(state_.assets)) {
    return fail(transaction_error_code::not_in_custody,
                fmt::format("asset {} has no custody record", asset_id));
  }
  entry->second.sale_proceeds += amount;
  entry->second.in_custody = false;
  entry->second.listed = false;
  journal_.emit("proceeds_recorded",
                {{"asset_id", std::to_string(asset_id)},
                 {"amount", to_string(amount)},
                 {"outstanding", to_string(entry->second.sale_proceeds)}});
  return std::nullopt;
}

}  // namespace tessera::custody
