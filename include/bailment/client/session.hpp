#pragma once

#include <bailment/schema/account.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/transaction_result.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace bailment::execution {
class engine;
}

namespace bailment::client {

/// Connection to a settlement executor. Each member is one call a transport
/// has to provide; `make_local_session` binds them to an in-process engine.
struct session final {
  std::function<bailment::schema::transaction_result_t(
      const bailment::schema::bytes_view_t& raw_tx)>
      submit;
  std::function<std::optional<bailment::schema::account_t>(
      const bailment::schema::pubkey_t& key)>
      get_account;
  std::function<uint64_t(const bailment::schema::pubkey_t& payer)> next_nonce;
  /// Commit height of a transaction id, empty when it was never applied.
  std::function<std::optional<int64_t>(const bailment::schema::hash32_t& id)>
      find_transaction;
  std::function<bailment::schema::unix_timestamp_t()> now;
  std::function<bailment::schema::hash32_t()> chain_id;
};

session make_local_session(bailment::execution::engine& engine);

}  // namespace bailment::client
