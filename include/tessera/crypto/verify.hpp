#pragma once

#include <tessera/schema/primitives.hpp>

namespace tessera::crypto {

/// True when the linked OpenSSL provides ed25519.
bool available();

bool verify_signature(const tessera::schema::bytes_view_t& message,
                      const tessera::schema::address_t& signer,
                      const tessera::schema::ed25519_signature_t& signature);

}  // namespace tessera::crypto
