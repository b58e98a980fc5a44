#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bootforge::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using disk_id_t = std::string;
using partition_id_t = std::string;
using timestamp_utc_t = std::string;  // RFC 3339, always UTC ("Z")
using duration_milliseconds_t = uint64_t;

inline constexpr auto kMebibyte = uint64_t{1024} * 1024;
inline constexpr auto kDefaultChunkSizeBytes = 8 * kMebibyte;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::optional<hash32_t> try_make_hash32(std::string_view hex);
hash32_t make_zero_hash();

/// Current wall-clock time formatted as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
timestamp_utc_t now_utc_rfc3339();

/// Random (version 4) UUID in canonical lowercase form.
std::string make_uuid();

/// True when `value` is a canonical 36-character UUID string.
bool is_uuid(std::string_view value);

}  // namespace bootforge::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
