#include <bailment/common/critical.hpp>
#include <bailment/crypto/keypair.hpp>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace bailment::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                          EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

keypair keypair::generate() {
  auto seed = ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    bailment::common::critical("failed to draw Ed25519 seed from RAND_bytes");
  }
  auto key = from_seed(seed);
  if (!key) {
    bailment::common::critical("failed to construct Ed25519 key pair");
  }
  return *key;
}

std::optional<keypair> keypair::from_seed(const ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = bailment::schema::pubkey_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return keypair{seed, public_key};
}

bailment::schema::ed25519_signature_t keypair::sign(
    const bailment::schema::bytes_view_t& message) const {
  auto pkey = make_private_key(seed_);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!pkey || !ctx) {
    bailment::common::critical("failed to allocate Ed25519 signing context");
  }
  auto signature = bailment::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
          1 ||
      EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    bailment::common::critical("Ed25519 signing failed");
  }
  return signature;
}

std::optional<keypair> keypair::load(const std::string_view path) {
  auto tree = boost::property_tree::ptree{};
  try {
    boost::property_tree::read_json(std::string{path}, tree);
  } catch (const boost::property_tree::json_parser_error& ex) {
    spdlog::warn("Failed to read key pair file '{}': {}", path, ex.what());
    return std::nullopt;
  }

  auto bytes = bailment::schema::bytes_t{};
  for (const auto& [name, child] : tree) {
    if (!name.empty()) {
      spdlog::warn("Key pair file '{}' is not a JSON byte array", path);
      return std::nullopt;
    }
    auto value = child.get_value_optional<int>();
    if (!value || *value < 0 || *value > 255) {
      spdlog::warn("Key pair file '{}' holds a non-byte entry", path);
      return std::nullopt;
    }
    bytes.push_back(static_cast<uint8_t>(*value));
  }
  if (bytes.size() != 64) {
    spdlog::warn("Key pair file '{}' holds {} bytes, expected 64", path,
                 bytes.size());
    return std::nullopt;
  }

  auto seed = ed25519_seed_t{};
  std::copy_n(std::begin(bytes), seed.size(), std::begin(seed));
  auto key = from_seed(seed);
  if (!key) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(key->public_key_), std::end(key->public_key_),
                  std::begin(bytes) + 32)) {
    spdlog::warn("Key pair file '{}' public half does not match its seed",
                 path);
    return std::nullopt;
  }
  return key;
}

bool keypair::save(const std::string_view path) const {
  auto target = std::filesystem::path{path};
  auto temporary = target;
  temporary += ".tmp";
  {
    auto out = std::ofstream{temporary, std::ios::trunc};
    if (!out) {
      spdlog::error("Failed to open '{}' for writing", temporary.string());
      return false;
    }
    out << '[';
    auto first = true;
    auto write_bytes = [&](const auto& bytes) {
      for (const auto byte : bytes) {
        out << (first ? "" : ",") << static_cast<int>(byte);
        first = false;
      }
    };
    write_bytes(seed_);
    write_bytes(public_key_);
    out << ']';
    if (!out) {
      spdlog::error("Failed to write key pair to '{}'", temporary.string());
      return false;
    }
  }
  auto error = std::error_code{};
  std::filesystem::permissions(temporary,
                               std::filesystem::perms::owner_read |
                                   std::filesystem::perms::owner_write,
                               error);
  if (error) {
    spdlog::warn("Failed to restrict permissions of '{}': {}",
                 temporary.string(), error.message());
  }
  std::filesystem::rename(temporary, target, error);
  if (error) {
    spdlog::error("Failed to move key pair into '{}': {}", target.string(),
                  error.message());
    return false;
  }
  return true;
}

}  // namespace bailment::crypto
