#pragma once

#include <bailment/address/derive.hpp>
#include <bailment/client/session.hpp>
#include <bailment/crypto/keypair.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/program_ids.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace bailment::client {

/// Namespace tags mixed into derived addresses. They must match the tags
/// compiled into the deployed program.
struct seed_namespace final {
  std::string vault{bailment::address::kVaultSeed};
  std::string escrow{bailment::address::kEscrowSeed};
};

/// Resubmission of transient failures. Authorization and precondition
/// failures are never retried. A transaction whose nonce went stale before it
/// was applied is signed again with the current nonce, at most
/// `max_nonce_refreshes` times.
struct retry_policy final {
  std::size_t max_attempts{3};
  std::size_t max_nonce_refreshes{3};
  std::chrono::milliseconds backoff{std::chrono::milliseconds{250}};
};

/// Everything an operation needs: who signs, where it is submitted and
/// which program it targets.
struct context final {
  const bailment::crypto::keypair& signer;
  session& ledger;
  bailment::schema::pubkey_t program_id{
      bailment::schema::program_ids::default_vault_escrow_program()};
  seed_namespace seeds;
  retry_policy retry;

  const bailment::schema::pubkey_t& payer() const {
    return signer.public_key();
  }
};

}  // namespace bailment::client
