#include <bootforge/common/critical.hpp>
#include <bootforge/crypto/hmac.hpp>

#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include <array>
#include <memory>

namespace bootforge::crypto {

namespace {

using evp_mac_ptr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using evp_mac_ctx_ptr =
    std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

}  // namespace

bootforge::schema::hash32_t hmac_sha256(
    const bootforge::schema::bytes_view_t& key,
    const bootforge::schema::bytes_view_t& message) {
  auto mac = evp_mac_ptr{EVP_MAC_fetch(nullptr, "HMAC", nullptr), EVP_MAC_free};
  if (!mac) {
    bootforge::common::critical("OpenSSL HMAC implementation unavailable");
  }
  auto context = evp_mac_ctx_ptr{EVP_MAC_CTX_new(mac.get()), EVP_MAC_CTX_free};
  if (!context) {
    bootforge::common::critical("failed to allocate EVP_MAC_CTX");
  }

  auto* digest_name = const_cast<char*>("SHA256");
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digest_name, 0),
      OSSL_PARAM_construct_end()};

  // An empty key is legal HMAC input; EVP_MAC_init wants a non-null pointer.
  static constexpr auto kEmptyKey = std::array<uint8_t, 1>{0};
  const auto* key_data = key.empty() ? kEmptyKey.data() : key.data();
  if (EVP_MAC_init(context.get(), key_data, key.size(), params.data()) != 1) {
    bootforge::common::critical("failed to initialize HMAC-SHA256");
  }
  if (!message.empty() &&
      EVP_MAC_update(context.get(), message.data(), message.size()) != 1) {
    bootforge::common::critical("failed to update HMAC-SHA256");
  }
  auto out = bootforge::schema::hash32_t{};
  auto length = std::size_t{0};
  if (EVP_MAC_final(context.get(), out.data(), &length, out.size()) != 1 ||
      length != out.size()) {
    bootforge::common::critical("failed to finalize HMAC-SHA256");
  }
  return out;
}

bool constant_time_equal(const bootforge::schema::bytes_view_t& lhs,
                         const bootforge::schema::bytes_view_t& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

bootforge::schema::bytes_t random_bytes(const std::size_t count) {
  auto out = bootforge::schema::bytes_t(count);
  if (count > 0 &&
      RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    bootforge::common::critical("OpenSSL CSPRNG failed");
  }
  return out;
}

}  // namespace bootforge::crypto
