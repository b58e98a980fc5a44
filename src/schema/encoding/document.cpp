#include <bootforge/schema/encoding/document.hpp>
#include <bootforge/schema/encoding/yaml/document.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace bootforge::schema::encoding {

namespace {

bool is_yaml_path(const std::filesystem::path& path) {
  auto extension = path.extension().string();
  std::transform(std::begin(extension), std::end(extension),
                 std::begin(extension),
                 [](unsigned char c) { return std::tolower(c); });
  return extension == ".yaml" || extension == ".yml";
}

}  // namespace

std::optional<bootforge::schema::bytes_t> read_file(
    const std::filesystem::path& path,
    bootforge::schema::error_t& error) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_regular_file(path, ec)) {
    error = make_error(error_code_t::not_found,
                       "no such file: " + path.string());
    return std::nullopt;
  }
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    error = make_error(error_code_t::io_error,
                       "cannot open " + path.string());
    return std::nullopt;
  }
  auto bytes = bootforge::schema::bytes_t{
      std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
  if (stream.bad()) {
    error = make_error(error_code_t::io_error,
                       "failed reading " + path.string());
    return std::nullopt;
  }
  return bytes;
}

bool write_file(const std::filesystem::path& path,
                const bootforge::schema::bytes_view_t& bytes,
                bootforge::schema::error_t& error) {
  auto stream =
      std::ofstream{path, std::ios::binary | std::ios::out | std::ios::trunc};
  if (!stream) {
    error = make_error(error_code_t::io_error,
                       "cannot open " + path.string() + " for writing");
    return false;
  }
  stream.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  stream.flush();
  if (!stream) {
    error = make_error(error_code_t::io_error,
                       "failed writing " + path.string());
    return false;
  }
  return true;
}

std::optional<nlohmann::json> read_document(const std::filesystem::path& path,
                                            bootforge::schema::error_t& error) {
  auto bytes = read_file(path, error);
  if (!bytes) {
    return std::nullopt;
  }
  if (is_yaml_path(path)) {
    return yaml::try_parse(make_string_view(*bytes), error);
  }
  auto document =
      nlohmann::json::parse(std::begin(*bytes), std::end(*bytes), nullptr, false);
  if (document.is_discarded()) {
    error = make_error(error_code_t::invalid_document,
                       "malformed JSON document: " + path.string());
    return std::nullopt;
  }
  return document;
}

}  // namespace bootforge::schema::encoding
