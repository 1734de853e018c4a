#pragma once
#include <bailment/codec/selector.hpp>
#include <bailment/schema/agreement_state.hpp>
#include <bailment/schema/encoding/scale/encoder.hpp>
#include <bailment/schema/primitives.hpp>
#include <bailment/schema/vault_state.hpp>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string_view>

// Program-owned records: an 8-byte account discriminator followed by the
// SCALE form of the record.
namespace bailment::codec {

template <typename Record>
struct record_traits;

template <>
struct record_traits<bailment::schema::vault_state_t> final {
  static constexpr auto kName = std::string_view{"Vault"};
};

template <>
struct record_traits<bailment::schema::agreement_state_t> final {
  static constexpr auto kName = std::string_view{"Escrow"};
};

template <typename Record>
const selector_t& record_discriminator() {
  static const auto discriminator =
      make_account_discriminator(record_traits<Record>::kName);
  return discriminator;
}

template <typename Record>
bailment::schema::bytes_t encode_record(const Record& record) {
  const auto& discriminator = record_discriminator<Record>();
  auto out = bailment::schema::bytes_t{std::begin(discriminator),
                                       std::end(discriminator)};
  auto encoder = bailment::schema::encoding::scale_encoder_t{};
  encoder.encode(record, out);
  return out;
}

/// True when `bytes` starts with the discriminator of Record.
template <typename Record>
bool has_discriminator(const bailment::schema::bytes_view_t& bytes) {
  const auto& discriminator = record_discriminator<Record>();
  return bytes.size() >= discriminator.size() &&
         std::equal(std::begin(discriminator), std::end(discriminator),
                    std::begin(bytes));
}

/// Parse a record previously written by encode_record. Empty when the
/// discriminator differs or the body does not decode exactly.
template <typename Record>
std::optional<Record> decode_record(
    const bailment::schema::bytes_view_t& bytes) {
  if (!has_discriminator<Record>(bytes)) {
    return std::nullopt;
  }
  auto body = bytes.subspan(kSelectorSize);
  auto encoder = bailment::schema::encoding::scale_encoder_t{};
  return encoder.try_decode_exact<Record>(body);
}

}  // namespace bailment::codec
