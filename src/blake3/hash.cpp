#include <blake3.h>
#include <bailment/blake3/hash.hpp>

static_assert(BLAKE3_OUT_LEN == sizeof(bailment::schema::hash32_t));

namespace bailment::blake3 {

bailment::schema::hash32_t hash(const std::string_view text) {
  return hash({bailment::schema::make_bytes_view(text)});
}

bailment::schema::hash32_t hash(
    const std::initializer_list<bailment::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  auto digest = bailment::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

}  // namespace bailment::blake3
