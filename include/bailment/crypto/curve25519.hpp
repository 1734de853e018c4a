#pragma once

#include <bailment/schema/primitives.hpp>

namespace bailment::crypto {

/// True when `key` is the compressed encoding of a point on the Ed25519
/// curve, i.e. a value that could have a private key behind it. Derived
/// program addresses are required to fail this check.
bool is_on_curve(const bailment::schema::pubkey_t& key);

}  // namespace bailment::crypto
