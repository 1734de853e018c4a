#include <bailment/client/session.hpp>
#include <bailment/execution/engine.hpp>

namespace bailment::client {

session make_local_session(bailment::execution::engine& engine) {
  return session{
      .submit =
          [&engine](const bailment::schema::bytes_view_t& raw_tx) {
            return engine.process_transaction(raw_tx);
          },
      .get_account =
          [&engine](const bailment::schema::pubkey_t& key) {
            return engine.get_account(key);
          },
      .next_nonce =
          [&engine](const bailment::schema::pubkey_t& payer) {
            return engine.next_nonce(payer);
          },
      .find_transaction =
          [&engine](const bailment::schema::hash32_t& id) {
            return engine.transaction_height(id);
          },
      .now = [&engine] { return engine.now(); },
      .chain_id = [&engine] { return engine.chain_id(); }};
}

}  // namespace bailment::client
