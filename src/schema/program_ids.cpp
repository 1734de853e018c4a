#include <bailment/schema/program_ids.hpp>

namespace bailment::schema::program_ids {

const pubkey_t& system_program() {
  static const auto key = make_pubkey("11111111111111111111111111111111");
  return key;
}

const pubkey_t& token_program() {
  static const auto key =
      make_pubkey("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
  return key;
}

const pubkey_t& holding_account_program() {
  static const auto key =
      make_pubkey("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
  return key;
}

const pubkey_t& default_vault_escrow_program() {
  static const auto key =
      make_pubkey("AhtmyF1FM2NwGYECDzgjC6jbNtPnSRDFzhahugFfqkZW");
  return key;
}

}  // namespace bailment::schema::program_ids
