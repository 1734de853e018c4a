#pragma once

#include <bailment/schema/primitives.hpp>

namespace bailment::crypto {

/// True when the linked OpenSSL verifies Ed25519 correctly (checked once
/// against a published test vector).
bool available();

bool verify_signature(const bailment::schema::bytes_view_t& message,
                      const bailment::schema::pubkey_t& signer,
                      const bailment::schema::ed25519_signature_t& signature);

}  // namespace bailment::crypto
