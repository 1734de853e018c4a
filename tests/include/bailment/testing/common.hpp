#pragma once

#include <bailment/crypto/keypair.hpp>
#include <bailment/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace bailment::testing {

inline bailment::schema::pubkey_t make_key(const uint8_t seed) {
  auto out = bailment::schema::pubkey_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic key pair; distinct seeds give distinct identities.
inline bailment::crypto::keypair make_keypair(const uint8_t seed) {
  auto material = bailment::crypto::ed25519_seed_t{};
  std::fill(std::begin(material), std::end(material), seed);
  return *bailment::crypto::keypair::from_seed(material);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace bailment::testing
