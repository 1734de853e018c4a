#pragma once
#include <bailment/schema/primitives.hpp>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace bailment::storage {

using key_value_entry_t =
    std::pair<bailment::schema::bytes_t, bailment::schema::bytes_t>;

/// Last committed executor checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  bailment::schema::hash32_t state_root{};
  bailment::schema::hash32_t chain_id{};
};

/// Writes of one atomic unit: every put lands, or none does.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<bailment::schema::bytes_t> deletes;
  std::optional<committed_state> checkpoint;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const bailment::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const bailment::schema::bytes_view_t& key,
           const T& value) const;

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<bailment::schema::bytes_t> get_raw(
      const bailment::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const bailment::schema::bytes_view_t& prefix) const;

  /// Apply all writes of a unit in one batch.
  void apply(const write_set& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

inline constexpr auto kAccountPrefix = std::string_view{"ACCOUNT|"};
inline constexpr auto kNoncePrefix = std::string_view{"NONCE|"};
inline constexpr auto kReceiptPrefix = std::string_view{"RECEIPT|"};
inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED"};

inline bailment::schema::bytes_t make_prefixed_key(
    const std::string_view prefix,
    const bailment::schema::pubkey_t& key) {
  auto out = bailment::schema::make_bytes(prefix);
  out.insert(std::end(out), std::begin(key), std::end(key));
  return out;
}

inline bailment::schema::bytes_t make_account_key(
    const bailment::schema::pubkey_t& key) {
  return make_prefixed_key(kAccountPrefix, key);
}

inline bailment::schema::bytes_t make_nonce_key(
    const bailment::schema::pubkey_t& key) {
  return make_prefixed_key(kNoncePrefix, key);
}

/// Committed transactions, keyed by transaction id.
inline bailment::schema::bytes_t make_receipt_key(
    const bailment::schema::hash32_t& id) {
  return make_prefixed_key(kReceiptPrefix, id);
}

}  // namespace bailment::storage
