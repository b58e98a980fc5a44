#include <bootforge/common/critical.hpp>
#include <bootforge/crypto/sha256.hpp>

#include <array>
#include <fstream>
#include <vector>

namespace bootforge::crypto {

namespace {

constexpr auto kFileBufferSize = std::size_t{1} << 20;

}  // namespace

sha256_hasher::sha256_hasher() : context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!context_) {
    bootforge::common::critical("failed to allocate EVP_MD_CTX");
  }
  reset();
}

void sha256_hasher::reset() {
  if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
    bootforge::common::critical("failed to initialize SHA-256 digest");
  }
}

void sha256_hasher::update(const bootforge::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return;
  }
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    bootforge::common::critical("failed to update SHA-256 digest");
  }
}

bootforge::schema::hash32_t sha256_hasher::finish() {
  auto digest = bootforge::schema::hash32_t{};
  auto length = static_cast<unsigned int>(0);
  if (EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    bootforge::common::critical("failed to finalize SHA-256 digest");
  }
  reset();
  return digest;
}

bootforge::schema::hash32_t sha256(
    const bootforge::schema::bytes_view_t& bytes) {
  auto hasher = sha256_hasher{};
  hasher.update(bytes);
  return hasher.finish();
}

bootforge::schema::hash32_t sha256(const std::string_view& str) {
  return sha256(bootforge::schema::make_bytes_view(str));
}

std::optional<bootforge::schema::hash32_t> sha256_file(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::not_found,
        "cannot open " + path.string());
    return std::nullopt;
  }
  auto hasher = sha256_hasher{};
  auto buffer = std::vector<char>(kFileBufferSize);
  while (stream) {
    stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = stream.gcount();
    if (count > 0) {
      hasher.update(bootforge::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(buffer.data()),
          static_cast<std::size_t>(count)});
    }
  }
  if (stream.bad()) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::io_error,
        "failed reading " + path.string());
    return std::nullopt;
  }
  return hasher.finish();
}

}  // namespace bootforge::crypto
