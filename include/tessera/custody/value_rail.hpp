#pragma once

#include <tessera/common/status.hpp>
#include <tessera/schema/world_state.hpp>
#include <functional>

namespace tessera::custody {

/// Invoked after value lands at a recipient; returning false refuses it.
///
/// This is the point at which a recipient can run code, including calls
/// back into the system.
using receive_hook_t =
    std::function<bool(const tessera::schema::address_t& recipient,
                       const tessera::schema::amount_t& amount)>;

/// Native value accounts plus the escrow the system pays out of.
class value_rail final {
 public:
  explicit value_rail(tessera::schema::value_rail_state_t& state,
                      receive_hook_t hook = {});

  tessera::schema::amount_t balance_of(
      const tessera::schema::address_t& account) const;
  const tessera::schema::amount_t& escrow() const { return state_.escrow; }

  /// Move value from `from` into escrow.
  tessera::common::status_t collect(const tessera::schema::address_t& from,
                                    const tessera::schema::amount_t& amount);

  /// Move value out of escrow to `to`.
  tessera::common::status_t pay(const tessera::schema::address_t& to,
                                const tessera::schema::amount_t& amount);

  void fund(const tessera::schema::address_t& account,
            const tessera::schema::amount_t& amount);
  void refuse_value(const tessera::schema::address_t& account);

 private:
  bool refuses(const tessera::schema::address_t& account) const;

  tessera::schema::value_rail_state_t& state_;
  receive_hook_t hook_;
};

}  // namespace tessera::custody
