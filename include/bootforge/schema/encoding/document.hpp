#pragma once
#include <bootforge/schema/encoding/json/encoder.hpp>
#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>

namespace bootforge::schema::encoding {

/// Read a whole file. Fails with `not_found` or `io_error`.
std::optional<bootforge::schema::bytes_t> read_file(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error);

/// Write a whole file, replacing any previous content.
bool write_file(const std::filesystem::path& path,
                const bootforge::schema::bytes_view_t& bytes,
                bootforge::schema::error_t& error);

/// Parse a JSON or YAML document, chosen by the `.yaml`/`.yml` extension.
std::optional<nlohmann::json> read_document(const std::filesystem::path& path,
                                            bootforge::schema::error_t& error);

/// Read a document file and decode it into `T`.
template <typename T>
std::optional<T> read_typed_document(const std::filesystem::path& path,
                                     bootforge::schema::error_t& error) {
  auto document = read_document(path, error);
  if (!document) {
    return std::nullopt;
  }
  auto codec = encoder<json_encoder_tag>{};
  return codec.try_from_document<T>(*document, error);
}

}  // namespace bootforge::schema::encoding
