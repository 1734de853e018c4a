#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bailment::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using pubkey_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;
using amount_t = uint64_t;
using unix_timestamp_t = int64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
bytes_view_t make_bytes_view(const pubkey_t& key);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);

/// Bitcoin-alphabet base58, the textual form of ledger identities.
std::string to_base58(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base58(std::string_view encoded);

/// Parse a 32-byte identity from base58 (or 64 hex characters).
std::optional<pubkey_t> try_make_pubkey(std::string_view text);
pubkey_t make_pubkey(std::string_view text);
std::string to_string(const pubkey_t& key);

pubkey_t make_zero_pubkey();

}  // namespace bailment::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
