#include <bailment/common/critical.hpp>
#include <bailment/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <utility>

namespace bailment::crypto {

void sha256_hasher::context_deleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new()} {
  if (!context_) {
    bailment::common::critical("failed to allocate SHA-256 context");
  }
  if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
    bailment::common::critical("failed to initialize SHA-256 context");
  }
}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;
sha256_hasher& sha256_hasher::operator=(sha256_hasher&&) noexcept = default;

sha256_hasher& sha256_hasher::update(
    const bailment::schema::bytes_view_t& bytes) {
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    bailment::common::critical("SHA-256 update failed");
  }
  return *this;
}

sha256_hasher& sha256_hasher::update(const std::string_view text) {
  return update(bailment::schema::make_bytes_view(text));
}

bailment::schema::hash32_t sha256_hasher::finalize() {
  auto out = bailment::schema::hash32_t{};
  auto length = static_cast<unsigned int>(out.size());
  if (EVP_DigestFinal_ex(context_.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    bailment::common::critical("SHA-256 finalize failed");
  }
  return out;
}

bailment::schema::hash32_t sha256(const bailment::schema::bytes_view_t& bytes) {
  return sha256_hasher{}.update(bytes).finalize();
}

bailment::schema::hash32_t sha256(const std::string_view text) {
  return sha256_hasher{}.update(text).finalize();
}

}  // namespace bailment::crypto
