#pragma once
#include <bailment/schema/primitives.hpp>
#include <optional>

namespace bailment::schema::encoding {

// Ledger records, instructions and transactions go through this seam. The
// wire library is a build time choice: callers name the tag
// (`encoder<scale_encoder_tag>`) and never the library itself.
template <typename Library>
struct encoder {
  template <typename T>
  bailment::schema::bytes_t encode(const T& obj);

  /// Append the encoding of `obj` to `out`.
  template <typename T>
  void encode(const T& obj, bailment::schema::bytes_t& out);

  /// Fatal on malformed input. Only for bytes this process wrote itself.
  template <typename T>
  T decode(const bailment::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bailment::schema::bytes_view_t& bytes);

  /// As try_decode, but `bytes` must hold exactly one value and nothing
  /// after it. Anything arriving from a signer goes through here.
  template <typename T>
  std::optional<T> try_decode_exact(
      const bailment::schema::bytes_view_t& bytes);
};

}  // namespace bailment::schema::encoding
