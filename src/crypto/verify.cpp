#include <bailment/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace bailment::crypto {

namespace {

using pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// RFC 8032 section 7.1, test 1: empty message.
constexpr auto kSelfTestKey = bailment::schema::pubkey_t{
    0xd7, 0x5a, 0x98, 0x01, 0x82, 0xb1, 0x0a, 0xb7, 0xd5, 0x4b, 0xfe,
    0xd3, 0xc9, 0x64, 0x07, 0x3a, 0x0e, 0xe1, 0x72, 0xf3, 0xda, 0xa6,
    0x23, 0x25, 0xaf, 0x02, 0x1a, 0x68, 0xf7, 0x07, 0x51, 0x1a};
constexpr auto kSelfTestSignature = bailment::schema::ed25519_signature_t{
    0xe5, 0x56, 0x43, 0x00, 0xc3, 0x60, 0xac, 0x72, 0x90, 0x86, 0xe2,
    0xcc, 0x80, 0x6e, 0x82, 0x8a, 0x84, 0x87, 0x7f, 0x1e, 0xb8, 0xe5,
    0xd9, 0x74, 0xd8, 0x73, 0xe0, 0x65, 0x22, 0x49, 0x01, 0x55, 0x5f,
    0xb8, 0x82, 0x15, 0x90, 0xa3, 0x3b, 0xac, 0xc6, 0x1e, 0x39, 0x70,
    0x1c, 0xf9, 0xb4, 0x6b, 0xd2, 0x5b, 0xf5, 0xf0, 0x59, 0x5b, 0xbe,
    0x24, 0x65, 0x51, 0x41, 0x43, 0x8e, 0x7a, 0x10, 0x0b};

bool passes_self_test() {
  auto message = bailment::schema::bytes_view_t{};
  if (!verify_signature(message, kSelfTestKey, kSelfTestSignature)) {
    return false;
  }
  auto tampered = kSelfTestSignature;
  tampered[0] ^= 0x01;
  return !verify_signature(message, kSelfTestKey, tampered);
}

}  // namespace

bool available() {
  static const auto verified = passes_self_test();
  return verified;
}

bool verify_signature(const bailment::schema::bytes_view_t& message,
                      const bailment::schema::pubkey_t& signer,
                      const bailment::schema::ed25519_signature_t& signature) {
  auto key = pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                  signer.data(), signer.size()),
                      EVP_PKEY_free};
  auto digest = md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!key || !digest) {
    return false;
  }
  // Ed25519 is one-shot: no digest algorithm, whole message at once.
  if (EVP_DigestVerifyInit(digest.get(), nullptr, nullptr, nullptr,
                           key.get()) != 1) {
    return false;
  }
  return EVP_DigestVerify(digest.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

}  // namespace bailment::crypto
