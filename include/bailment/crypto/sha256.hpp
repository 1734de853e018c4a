#pragma once

#include <bailment/schema/primitives.hpp>

#include <memory>
#include <string_view>

struct evp_md_ctx_st;

namespace bailment::crypto {

/// Incremental SHA-256 over OpenSSL EVP.
class sha256_hasher final {
 public:
  sha256_hasher();
  ~sha256_hasher();

  sha256_hasher(const sha256_hasher&) = delete;
  sha256_hasher& operator=(const sha256_hasher&) = delete;
  sha256_hasher(sha256_hasher&&) noexcept;
  sha256_hasher& operator=(sha256_hasher&&) noexcept;

  sha256_hasher& update(const bailment::schema::bytes_view_t& bytes);
  sha256_hasher& update(std::string_view text);

  /// Finish the digest. The hasher must not be updated afterwards.
  bailment::schema::hash32_t finalize();

 private:
  struct context_deleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, context_deleter> context_;
};

bailment::schema::hash32_t sha256(const bailment::schema::bytes_view_t& bytes);
bailment::schema::hash32_t sha256(std::string_view text);

}  // namespace bailment::crypto
