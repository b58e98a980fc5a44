#pragma once

#include <bootforge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bootforge::schema {

enum class step_status_t : uint8_t {
  success = 0,
  failed = 1,
  cancelled = 2,
  not_run = 3
};

inline constexpr auto kStepStatusMappings = std::array{
    std::pair<std::string_view, step_status_t>{"success",
                                               step_status_t::success},
    std::pair<std::string_view, step_status_t>{"failed", step_status_t::failed},
    std::pair<std::string_view, step_status_t>{"cancelled",
                                               step_status_t::cancelled},
    std::pair<std::string_view, step_status_t>{"not_run",
                                               step_status_t::not_run}};

template <>
inline std::optional<step_status_t> try_from_string<step_status_t>(
    const std::string_view value) {
  return from_string(value, kStepStatusMappings);
}

inline constexpr std::string_view to_string(const step_status_t value) {
  return to_string(value, kStepStatusMappings).value_or("unknown");
}

enum class run_status_t : uint8_t {
  running = 0,
  succeeded = 1,
  failed = 2,
  cancelled = 3
};

inline constexpr auto kRunStatusMappings = std::array{
    std::pair<std::string_view, run_status_t>{"running", run_status_t::running},
    std::pair<std::string_view, run_status_t>{"succeeded",
                                              run_status_t::succeeded},
    std::pair<std::string_view, run_status_t>{"failed", run_status_t::failed},
    std::pair<std::string_view, run_status_t>{"cancelled",
                                              run_status_t::cancelled}};

template <>
inline std::optional<run_status_t> try_from_string<run_status_t>(
    const std::string_view value) {
  return from_string(value, kRunStatusMappings);
}

inline constexpr std::string_view to_string(const run_status_t value) {
  return to_string(value, kRunStatusMappings).value_or("unknown");
}

}  // namespace bootforge::schema
