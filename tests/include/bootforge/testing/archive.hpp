#pragma once

#include <bootforge/schema/error_code.hpp>
#include <bootforge/schema/primitives.hpp>

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bootforge::testing {

struct archive_member final {
  std::string name;
  bootforge::schema::bytes_t bytes;
};

namespace detail {

using tar_header_t = std::array<char, 512>;

inline std::optional<uint64_t> tar_octal(const char* field,
                                         const std::size_t width) {
  auto value = uint64_t{0};
  auto seen = false;
  for (std::size_t i = 0; i < width; ++i) {
    auto c = field[i];
    if (c == '\0' || c == ' ') {
      if (seen) {
        break;
      }
      continue;
    }
    if (c < '0' || c > '7') {
      return std::nullopt;
    }
    value = (value << 3u) | static_cast<uint64_t>(c - '0');
    seen = true;
  }
  return value;
}

inline std::string tar_string(const char* field, const std::size_t width) {
  auto length = std::find(field, field + width, '\0') - field;
  return std::string{field, static_cast<std::size_t>(length)};
}

inline uint32_t tar_checksum(const tar_header_t& header) {
  auto sum = uint32_t{0};
  for (std::size_t i = 0; i < header.size(); ++i) {
    auto c = (i >= 148 && i < 156) ? static_cast<unsigned char>(' ')
                                   : static_cast<unsigned char>(header[i]);
    sum += c;
  }
  return sum;
}

inline bool gz_read_exact(gzFile file, void* data, const std::size_t length) {
  auto* cursor = static_cast<char*>(data);
  auto left = length;
  while (left > 0) {
    auto count = gzread(file, cursor, static_cast<unsigned int>(
                                          std::min<std::size_t>(left, 1u << 30)));
    if (count <= 0) {
      return false;
    }
    left -= static_cast<std::size_t>(count);
    cursor += count;
  }
  return true;
}

}  // namespace detail

/// Read back every regular-file member of a `.tar.gz`, applying GNU
/// long-name records to the member that follows them.
inline std::optional<std::vector<archive_member>> read_tar_gz(
    const std::filesystem::path& input,
    bootforge::schema::error_t& error) {
  using bootforge::schema::error_code_t;
  auto file = std::unique_ptr<gzFile_s, decltype(&gzclose)>{
      gzopen(input.c_str(), "rb"), gzclose};
  if (!file) {
    error = bootforge::schema::make_error(error_code_t::not_found,
                                          "cannot open " + input.string());
    return std::nullopt;
  }

  auto members = std::vector<archive_member>{};
  auto long_name = std::optional<std::string>{};
  auto header = detail::tar_header_t{};
  while (true) {
    if (!detail::gz_read_exact(file.get(), header.data(), header.size())) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document,
          input.string() + " ends without a trailer");
      return std::nullopt;
    }
    if (std::all_of(std::begin(header), std::end(header),
                    [](char c) { return c == '\0'; })) {
      break;
    }
    auto stored = detail::tar_octal(header.data() + 148, 8);
    auto size = detail::tar_octal(header.data() + 124, 12);
    if (!stored || !size || *stored != detail::tar_checksum(header)) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document,
          "corrupt ustar header in " + input.string());
      return std::nullopt;
    }
    auto name = detail::tar_string(header.data(), 100);
    auto prefix = detail::tar_string(header.data() + 345, 155);
    if (!prefix.empty()) {
      name = prefix + "/" + name;
    }

    auto bytes = bootforge::schema::bytes_t(static_cast<std::size_t>(*size));
    auto padding = (512 - *size % 512) % 512;
    auto skip = detail::tar_header_t{};
    if (!detail::gz_read_exact(file.get(), bytes.data(), bytes.size()) ||
        !detail::gz_read_exact(file.get(), skip.data(), padding)) {
      error = bootforge::schema::make_error(
          error_code_t::invalid_document,
          "truncated member " + name + " in " + input.string());
      return std::nullopt;
    }
    auto type = header[156];
    if (type == 'L') {
      long_name = detail::tar_string(reinterpret_cast<const char*>(bytes.data()),
                                     bytes.size());
      continue;
    }
    if (type == '0' || type == '\0') {
      members.push_back(archive_member{.name = long_name.value_or(name),
                                       .bytes = std::move(bytes)});
    }
    long_name.reset();
  }
  return members;
}

}  // namespace bootforge::testing
