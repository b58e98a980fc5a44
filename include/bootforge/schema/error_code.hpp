#pragma once

#include <bootforge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bootforge::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  enumeration_error = 1,
  // Safety denials. Never retried automatically.
  system_disk_protected = 10,
  missing_confirmation_token = 11,
  force_mode_required = 12,
  disk_not_found = 13,
  // Imaging I/O faults.
  not_found = 20,
  access_denied = 21,
  device_busy = 22,
  io_error = 23,
  cancelled = 30,
  // Document validation faults, raised before any device is touched.
  unsupported_action = 40,
  invalid_step_params = 41,
  schema_version_mismatch = 42,
  invalid_document = 43,
  integrity_violation = 50,
  invalid_argument = 60,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"ok", error_code_t::ok},
    std::pair<std::string_view, error_code_t>{"enumeration_error",
                                              error_code_t::enumeration_error},
    std::pair<std::string_view, error_code_t>{
        "system_disk_protected", error_code_t::system_disk_protected},
    std::pair<std::string_view, error_code_t>{
        "missing_confirmation_token",
        error_code_t::missing_confirmation_token},
    std::pair<std::string_view, error_code_t>{
        "force_mode_required", error_code_t::force_mode_required},
    std::pair<std::string_view, error_code_t>{"disk_not_found",
                                              error_code_t::disk_not_found},
    std::pair<std::string_view, error_code_t>{"not_found",
                                              error_code_t::not_found},
    std::pair<std::string_view, error_code_t>{"access_denied",
                                              error_code_t::access_denied},
    std::pair<std::string_view, error_code_t>{"device_busy",
                                              error_code_t::device_busy},
    std::pair<std::string_view, error_code_t>{"io_error",
                                              error_code_t::io_error},
    std::pair<std::string_view, error_code_t>{"cancelled",
                                              error_code_t::cancelled},
    std::pair<std::string_view, error_code_t>{
        "unsupported_action", error_code_t::unsupported_action},
    std::pair<std::string_view, error_code_t>{
        "invalid_step_params", error_code_t::invalid_step_params},
    std::pair<std::string_view, error_code_t>{
        "schema_version_mismatch", error_code_t::schema_version_mismatch},
    std::pair<std::string_view, error_code_t>{"invalid_document",
                                              error_code_t::invalid_document},
    std::pair<std::string_view, error_code_t>{
        "integrity_violation", error_code_t::integrity_violation},
    std::pair<std::string_view, error_code_t>{"invalid_argument",
                                              error_code_t::invalid_argument}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// True for the denials produced by the safety gate.
inline constexpr bool is_safety_denial(const error_code_t value) {
  return value == error_code_t::system_disk_protected ||
         value == error_code_t::missing_confirmation_token ||
         value == error_code_t::force_mode_required ||
         value == error_code_t::disk_not_found;
}

struct error_t final {
  error_code_t code{error_code_t::ok};
  std::string message;
};

inline error_t make_error(const error_code_t code, std::string message) {
  return error_t{.code = code, .message = std::move(message)};
}

}  // namespace bootforge::schema
