#pragma once
#include <bailment/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

// Fixed-width little-endian argument packing shared by the instruction
// codecs.
namespace bailment::codec {

template <typename T>
void append_le(bailment::schema::bytes_t& out, const T value) {
  auto buffer = std::array<uint8_t, sizeof(T)>{};
  boost::endian::endian_store<T, sizeof(T), boost::endian::order::little>(
      buffer.data(), value);
  out.insert(std::end(out), std::begin(buffer), std::end(buffer));
}

inline void append_key(bailment::schema::bytes_t& out,
                       const bailment::schema::pubkey_t& key) {
  out.insert(std::end(out), std::begin(key), std::end(key));
}

/// Sequential reader over an instruction payload. Every read fails once the
/// payload is exhausted; `finished()` tells whether bytes remain.
class le_reader final {
 public:
  explicit le_reader(const bailment::schema::bytes_view_t& bytes)
      : bytes_{bytes} {}

  template <typename T>
  std::optional<T> read() {
    if (remaining() < sizeof(T)) {
      return std::nullopt;
    }
    auto value =
        boost::endian::endian_load<T, sizeof(T), boost::endian::order::little>(
            bytes_.data() + offset_);
    offset_ += sizeof(T);
    return value;
  }

  std::optional<bailment::schema::pubkey_t> read_key() {
    if (remaining() < sizeof(bailment::schema::pubkey_t)) {
      return std::nullopt;
    }
    auto key = bailment::schema::pubkey_t{};
    std::copy_n(bytes_.data() + offset_, key.size(), std::begin(key));
    offset_ += key.size();
    return key;
  }

  bool skip(const std::size_t count) {
    if (remaining() < count) {
      return false;
    }
    offset_ += count;
    return true;
  }

  std::size_t remaining() const { return bytes_.size() - offset_; }
  bool finished() const { return remaining() == 0; }

 private:
  bailment::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace bailment::codec
