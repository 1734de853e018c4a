#pragma once

#include <bailment/schema/primitives.hpp>
#include <functional>

namespace bailment::execution {

using signature_verifier_t =
    std::function<bool(const bailment::schema::bytes_view_t& message,
                       const bailment::schema::pubkey_t& signer,
                       const bailment::schema::ed25519_signature_t& signature)>;

/// Source of the executor's notion of "now", in Unix seconds.
using unix_clock_t = std::function<bailment::schema::unix_timestamp_t()>;

}  // namespace bailment::execution
