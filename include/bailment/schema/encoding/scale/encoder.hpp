#pragma once
#include <bailment/common/critical.hpp>
#include <bailment/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>
#include <string>
#include <typeinfo>
#include <utility>

// Records, instructions and transactions are plain aggregates; the SCALE
// library decomposes them field by field, so fixed-width integers and
// fixed-size arrays land on the wire little-endian and unprefixed. Vectors
// carry a compact length prefix and optionals a one-byte presence flag.
namespace bailment::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bailment::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bailment::schema::bytes_t& out);

  template <typename T>
  T decode(const bailment::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bailment::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode_exact(
      const bailment::schema::bytes_view_t& bytes);
};

template <typename T>
bailment::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    bailment::common::critical(std::string{"cannot SCALE-encode "} +
                               typeid(T).name());
  }
  return std::move(encoded.value());
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        bailment::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const bailment::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    bailment::common::critical(std::string{"stored bytes are not a SCALE "} +
                               typeid(T).name());
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bailment::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode_exact(
    const bailment::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  // SCALE is canonical for these types, so a value that re-encodes shorter
  // than its input left bytes unread.
  if (!decoded || encode(*decoded).size() != bytes.size()) {
    return std::nullopt;
  }
  return decoded;
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace bailment::schema::encoding
