#include <tessera/blake3/hash.hpp>
#include <tessera/custody/system_accounts.hpp>

namespace tessera::custody {

const tessera::schema::address_t& vault_address() {
  static const auto address = tessera::blake3::hash("tessera/custody-vault");
  return address;
}

const tessera::schema::address_t& timelock_address() {
  static const auto address = tessera::blake3::hash("tessera/timelock");
  return address;
}

}  // namespace tessera::custody
