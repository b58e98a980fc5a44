#pragma once
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <openssl/evp.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace bootforge::crypto {

/// Incremental SHA-256 over OpenSSL EVP.
///
/// Bytes are accumulated in call order; `finish` returns the digest and
/// resets the hasher so it can be reused.
class sha256_hasher final {
 public:
  sha256_hasher();

  sha256_hasher(const sha256_hasher&) = delete;
  sha256_hasher& operator=(const sha256_hasher&) = delete;
  sha256_hasher(sha256_hasher&&) = default;
  sha256_hasher& operator=(sha256_hasher&&) = default;

  void update(const bootforge::schema::bytes_view_t& bytes);
  bootforge::schema::hash32_t finish();
  void reset();

 private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
};

bootforge::schema::hash32_t sha256(const bootforge::schema::bytes_view_t& bytes);
bootforge::schema::hash32_t sha256(const std::string_view& str);

/// Stream a regular file through SHA-256.
std::optional<bootforge::schema::hash32_t> sha256_file(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error);

}  // namespace bootforge::crypto
