#pragma once
#include <bailment/schema/primitives.hpp>

namespace bailment::schema {

/// Ledger account: the owning program decides how `data` is interpreted and
/// is the only program allowed to change it.
template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  pubkey_t owner{};
  bytes_t data;
};

using account_t = account<1>;

/// One positional entry of an instruction's account list.
struct account_meta_t final {
  pubkey_t key{};
  bool is_signer{};
  bool is_writable{};
};

inline account_meta_t make_signer_meta(const pubkey_t& key) {
  return account_meta_t{.key = key, .is_signer = true, .is_writable = true};
}

inline account_meta_t make_writable_meta(const pubkey_t& key) {
  return account_meta_t{.key = key, .is_signer = false, .is_writable = true};
}

inline account_meta_t make_readonly_meta(const pubkey_t& key) {
  return account_meta_t{.key = key, .is_signer = false, .is_writable = false};
}

}  // namespace bailment::schema
