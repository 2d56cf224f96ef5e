#pragma once

#include <tessera/schema/primitives.hpp>

namespace tessera::custody {

/// Account that holds custodied assets and mints/burns fraction claims.
const tessera::schema::address_t& vault_address();

/// Caller identity for calls applied by the timelock.
const tessera::schema::address_t& timelock_address();

}  // namespace tessera::custody
