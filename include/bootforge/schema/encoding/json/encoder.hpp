#pragma once
#include <bootforge/common/critical.hpp>
#include <bootforge/schema/encoding/encoder.hpp>
#include <bootforge/schema/encoding/json/chunk_plan.hpp>
#include <bootforge/schema/encoding/json/device_graph.hpp>
#include <bootforge/schema/encoding/json/disk.hpp>
#include <bootforge/schema/encoding/json/host_info.hpp>
#include <bootforge/schema/encoding/json/pack_manifest.hpp>
#include <bootforge/schema/encoding/json/partition.hpp>
#include <bootforge/schema/encoding/json/report_manifest.hpp>
#include <bootforge/schema/encoding/json/run_metadata.hpp>
#include <bootforge/schema/encoding/json/step_result.hpp>
#include <bootforge/schema/encoding/json/token_record.hpp>
#include <bootforge/schema/encoding/json/workflow.hpp>
#include <bootforge/schema/error_code.hpp>
#include <iterator>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace bootforge::schema::encoding {

struct json_encoder_tag {};

/// JSON documents as written to disk: two-space indentation, object keys in
/// lexicographic order, trailing newline. The output is deterministic, so
/// digests over encoded documents are reproducible.
template <>
struct encoder<json_encoder_tag> final {
  template <typename T>
  bootforge::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bootforge::schema::bytes_t& out);

  template <typename T>
  T decode(const bootforge::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bootforge::schema::bytes_view_t& bytes);

  /// Decode with the parser or field error reported as `invalid_document`.
  template <typename T>
  std::optional<T> try_decode(const bootforge::schema::bytes_view_t& bytes,
                              bootforge::schema::error_t& error);

  /// Convert an already parsed document (for example one read from YAML).
  template <typename T>
  std::optional<T> try_from_document(const nlohmann::json& document,
                                     bootforge::schema::error_t& error);
};

template <typename T>
bootforge::schema::bytes_t encoder<json_encoder_tag>::encode(const T& obj) {
  auto document = nlohmann::json(obj);
  auto text = document.dump(2);
  text.push_back('\n');
  return bootforge::schema::make_bytes(text);
}

template <typename T>
void encoder<json_encoder_tag>::encode(const T& obj,
                                       bootforge::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<json_encoder_tag>::decode(
    const bootforge::schema::bytes_view_t& bytes) {
  auto error = bootforge::schema::error_t{};
  auto decoded = try_decode<T>(bytes, error);
  if (!decoded) {
    bootforge::common::critical("failed to decode JSON document: {}",
                                error.message);
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const bootforge::schema::bytes_view_t& bytes) {
  auto error = bootforge::schema::error_t{};
  return try_decode<T>(bytes, error);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const bootforge::schema::bytes_view_t& bytes,
    bootforge::schema::error_t& error) {
  auto document = nlohmann::json::parse(std::begin(bytes), std::end(bytes),
                                        nullptr, false);
  if (document.is_discarded()) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::invalid_document,
        "malformed JSON document");
    return std::nullopt;
  }
  return try_from_document<T>(document, error);
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_from_document(
    const nlohmann::json& document,
    bootforge::schema::error_t& error) {
  try {
    return document.get<T>();
  } catch (const std::exception& e) {
    error = bootforge::schema::make_error(
        bootforge::schema::error_code_t::invalid_document, e.what());
    return std::nullopt;
  }
}

}  // namespace bootforge::schema::encoding
