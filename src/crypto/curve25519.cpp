#include <bailment/crypto/curve25519.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <iterator>

namespace bailment::crypto {

namespace {

namespace mp = boost::multiprecision;

// Field arithmetic over p = 2^255 - 19, following the point decompression of
// RFC 8032 section 5.1.3 without the final sign adjustment.
const mp::cpp_int& field_prime() {
  static const auto p = (mp::cpp_int{1} << 255) - 19;
  return p;
}

const mp::cpp_int& edwards_d() {
  static const auto d = mp::cpp_int{
      "37095705934669439343138083508754565189542113879843219016388785533085940"
      "283555"};
  return d;
}

mp::cpp_int reduce(const mp::cpp_int& value) {
  const auto& p = field_prime();
  auto out = mp::cpp_int{value % p};
  if (out < 0) {
    out += p;
  }
  return out;
}

}  // namespace

bool is_on_curve(const bailment::schema::pubkey_t& key) {
  const auto& p = field_prime();

  auto encoded = key;
  encoded[31] &= 0x7Fu;
  auto y = mp::cpp_int{};
  mp::import_bits(y, std::begin(encoded), std::end(encoded), 8, false);
  // Non-canonical encodings (y >= p) are reduced, matching the decompression
  // used by the ledger.
  y = reduce(y);

  auto y2 = reduce(y * y);
  auto u = reduce(y2 - 1);
  auto v = reduce(edwards_d() * y2 + 1);

  auto v3 = reduce(v * v * v);
  auto v7 = reduce(v3 * v3 * v);
  auto exponent = mp::cpp_int{(p - 5) / 8};
  auto r = reduce(u * v3 * mp::cpp_int{mp::powm(reduce(u * v7), exponent, p)});
  auto check = reduce(v * r * r);

  auto neg_u = reduce(p - u);
  return check == u || check == neg_u;
}

}  // namespace bailment::crypto
