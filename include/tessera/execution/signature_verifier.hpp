#pragma once

#include <tessera/schema/primitives.hpp>
#include <functional>

namespace tessera::execution {

using signature_verifier_t =
    std::function<bool(const tessera::schema::bytes_view_t& message,
                       const tessera::schema::address_t& signer,
                       const tessera::schema::ed25519_signature_t& signature)>;

}  // namespace tessera::execution
